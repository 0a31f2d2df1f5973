#include "tellcore/core/native_handle.h"
#include "tellcore/core/callback_bridge.h"
#include "tellcore/core/errors.h"

#include "common/logger.h"

namespace tellcore {
namespace core {

namespace {
constexpr const char* kComponent = "NativeHandle";
}

NativeHandle& NativeHandle::getInstance() {
    static NativeHandle instance;
    return instance;
}

NativeHandle::NativeHandle()
    : loader_(std::make_shared<DynamicModuleLoader>()) {}

void NativeHandle::open(const std::string& libraryName) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (module_) {
        if (!libraryName.empty() && libraryName != libraryName_) {
            common::logWarning("Library already loaded from " + libraryName_ +
                                   ", ignoring " + libraryName,
                               kComponent);
        }
        ++refCount_;
        return;
    }

    const std::string name =
        libraryName.empty() ? defaultLibraryName() : libraryName;
    void* module = loader_->load(name);

    functions_.bind(*loader_, module);
    if (!functions_.has(FunctionId::INIT)) {
        functions_.clear();
        loader_->unload(module);
        throw LoadError(name, "tdInit not exported");
    }

    functions_.get<FunctionId::INIT>()();

    module_ = module;
    libraryName_ = name;
    ++generation_;
    refCount_ = 1;

    common::logInfo("Telldus Core loaded from " + name + " (" +
                        std::to_string(functions_.boundCount()) + "/" +
                        std::to_string(kFunctionCount) +
                        " entry points, generation " +
                        std::to_string(generation_) + ")",
                    kComponent);
}

void NativeHandle::release() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (refCount_ <= 0) {
        throw ContractViolation("NativeHandle released without a matching open");
    }
    if (--refCount_ == 0) {
        shutdownLocked();
    }
}

void NativeHandle::shutdownLocked() {
    auto& bridge = CallbackBridge::getInstance();
    bridge.unregisterAll();
    bridge.clearDispatcher();

    // Before 2.1.2 (no tdController) the library cannot be initialised again
    // after tdClose.
    if (functions_.has(FunctionId::CONTROLLER) &&
        functions_.has(FunctionId::CLOSE)) {
        functions_.get<FunctionId::CLOSE>()();
    } else {
        common::logDebug("Skipping tdClose for pre 2.1.2 library", kComponent);
    }

    functions_.clear();
    void* module = module_;
    module_ = nullptr;
    libraryName_.clear();
    loader_->unload(module);

    common::logInfo("Telldus Core closed (generation " +
                        std::to_string(generation_) + ")",
                    kComponent);
}

bool NativeHandle::isOpen() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return module_ != nullptr;
}

int NativeHandle::referenceCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return refCount_;
}

std::uint64_t NativeHandle::generation() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return generation_;
}

std::string NativeHandle::libraryName() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return libraryName_;
}

void NativeHandle::setModuleLoader(std::shared_ptr<ModuleLoader> loader) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (module_) {
        throw ContractViolation("Cannot replace the module loader while open");
    }
    loader_ = loader ? std::move(loader) : std::make_shared<DynamicModuleLoader>();
}

std::shared_ptr<ModuleLoader> NativeHandle::moduleLoader() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return loader_;
}

} // namespace core
} // namespace tellcore
