#pragma once

#include <string>

namespace tellcore {
namespace core {

/**
 * @brief Platform specific default name of the Telldus Core library
 *
 * "TelldusCore.dll" on Windows, "libtelldus-core.so.2" on Linux. On macOS the
 * framework is looked up through the dynamic loader first and then at
 * /Library/Frameworks.
 */
std::string defaultLibraryName();

/**
 * @brief Loads native modules and resolves symbols in them
 *
 * NativeHandle goes through this interface so tests and embedders can supply
 * their own module source.
 */
class ModuleLoader {
public:
    virtual ~ModuleLoader() = default;

    /**
     * @brief Load a module
     * @param name File name or path of the module
     * @return Opaque module handle, never null
     * @throws LoadError if the module cannot be loaded
     */
    virtual void* load(const std::string& name) = 0;

    /**
     * @brief Resolve a symbol
     * @return Address of the symbol or nullptr if the module lacks it
     */
    virtual void* symbol(void* module, const char* name) const = 0;

    /**
     * @brief Unload a module previously returned by load()
     */
    virtual void unload(void* module) = 0;
};

/**
 * @brief ModuleLoader over dlopen/dlsym (LoadLibrary/GetProcAddress on
 * Windows)
 */
class DynamicModuleLoader : public ModuleLoader {
public:
    void* load(const std::string& name) override;
    void* symbol(void* module, const char* name) const override;
    void unload(void* module) override;
};

} // namespace core
} // namespace tellcore
