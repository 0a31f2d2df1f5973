#include "tellcore/core/module_loader.h"
#include "tellcore/core/errors.h"

#include "common/logger.h"

#ifdef _WIN32
#include <windows.h>
#else
#include <dlfcn.h>
#endif

namespace tellcore {
namespace core {

namespace {

constexpr const char* kComponent = "ModuleLoader";

#ifdef __APPLE__
constexpr const char* kFrameworkName = "TelldusCore.framework/TelldusCore";
constexpr const char* kFrameworkPath =
    "/Library/Frameworks/TelldusCore.framework/TelldusCore";
#endif

} // namespace

std::string defaultLibraryName() {
#if defined(_WIN32)
    return "TelldusCore.dll";
#elif defined(__APPLE__)
    // dyld searches the framework paths for a relative framework name
    if (void* probe = dlopen(kFrameworkName, RTLD_LAZY | RTLD_NOLOAD)) {
        dlclose(probe);
        return kFrameworkName;
    }
    if (void* probe = dlopen(kFrameworkName, RTLD_LAZY)) {
        dlclose(probe);
        return kFrameworkName;
    }
    return kFrameworkPath;
#else
    return "libtelldus-core.so.2";
#endif
}

void* DynamicModuleLoader::load(const std::string& name) {
#ifdef _WIN32
    HMODULE handle = LoadLibraryA(name.c_str());
    if (!handle) {
        throw LoadError(name, "LoadLibrary failed with error " +
                                  std::to_string(GetLastError()));
    }
    common::logDebug("Loaded " + name, kComponent);
    return reinterpret_cast<void*>(handle);
#else
    void* handle = dlopen(name.c_str(), RTLD_NOW | RTLD_LOCAL);
    if (!handle) {
        const char* error = dlerror();
        throw LoadError(name, error ? error : "dlopen failed");
    }
    common::logDebug("Loaded " + name, kComponent);
    return handle;
#endif
}

void* DynamicModuleLoader::symbol(void* module, const char* name) const {
#ifdef _WIN32
    return reinterpret_cast<void*>(
        GetProcAddress(reinterpret_cast<HMODULE>(module), name));
#else
    dlerror();
    void* address = dlsym(module, name);
    if (dlerror() != nullptr) {
        return nullptr;
    }
    return address;
#endif
}

void DynamicModuleLoader::unload(void* module) {
    if (!module) {
        return;
    }
#ifdef _WIN32
    FreeLibrary(reinterpret_cast<HMODULE>(module));
#else
    if (dlclose(module) != 0) {
        const char* error = dlerror();
        common::logWarning(std::string("dlclose failed: ") +
                               (error ? error : "unknown error"),
                           kComponent);
    }
#endif
}

} // namespace core
} // namespace tellcore
