#pragma once

#include "tellcore/core/function_table.h"
#include "tellcore/core/module_loader.h"

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

namespace tellcore {
namespace core {

/**
 * @brief Process-wide reference counted session with the native library
 *
 * The first open() of a generation loads the module, binds the function table
 * and calls tdInit. Every open() must be paired with one release(); the last
 * release unregisters remaining callbacks, calls tdClose and unloads the
 * module. A later open() starts a new generation from scratch.
 */
class NativeHandle {
public:
    static NativeHandle& getInstance();

    /**
     * @brief Acquire a reference, loading the library if needed
     * @param libraryName Library file name or path, empty for the platform
     * default. Ignored if a generation is already open.
     * @throws LoadError if the library cannot be loaded or lacks tdInit
     */
    void open(const std::string& libraryName = "");

    /**
     * @brief Drop a reference; the last one shuts the library down
     * @throws ContractViolation if no reference is held
     */
    void release();

    bool isOpen() const;
    int referenceCount() const;

    /**
     * @brief Number of generations started so far
     */
    std::uint64_t generation() const;

    /**
     * @brief Name the current generation was loaded from
     */
    std::string libraryName() const;

    /**
     * @brief Entry points of the current generation
     *
     * Only meaningful while a reference is held; unbound otherwise.
     */
    const FunctionTable& functions() const { return functions_; }

    /**
     * @brief Replace the module loader
     * @throws ContractViolation while a generation is open
     */
    void setModuleLoader(std::shared_ptr<ModuleLoader> loader);

    std::shared_ptr<ModuleLoader> moduleLoader() const;

private:
    NativeHandle();
    ~NativeHandle() = default;
    NativeHandle(const NativeHandle&) = delete;
    NativeHandle& operator=(const NativeHandle&) = delete;

    void shutdownLocked();

    mutable std::mutex mutex_;
    std::shared_ptr<ModuleLoader> loader_;
    void* module_ = nullptr;
    int refCount_ = 0;
    std::uint64_t generation_ = 0;
    std::string libraryName_;
    FunctionTable functions_;
};

} // namespace core
} // namespace tellcore
