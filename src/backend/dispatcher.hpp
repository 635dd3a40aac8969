/**
 * @file dispatcher.hpp
 * @brief Backend plugin registry and one-time backend selection
 *
 * Accelerator plugins register a factory with BackendRegistry at process
 * start. BackendDispatcher walks the registered candidates once, from
 * highest to lowest priority (tensor accelerator, GPU), and settles on the
 * first one that comes up and, when validation is enabled, reproduces the
 * CPU reference on a known-answer probe. The CPU reference backend ends the
 * chain.
 *
 * Usage:
 * @code
 * BackendRegistry::global().register_backend(
 *     BackendKind::Gpu, "my-gpu",
 *     [](const Config& cfg) { return std::make_shared<MyGpuBackend>(cfg); });
 *
 * BackendDispatcher dispatcher(BackendRegistry::global(), Config::from_environment());
 * auto backend = dispatcher.select();
 * @endcode
 *
 * @version 1.0.0
 */

#pragma once

#include "backend.hpp"
#include "../pqlattice_config.hpp"

#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace pqlattice {
namespace backend {

/**
 * @brief Builds a backend; throws BackendInitializationError when the device
 *        is unusable
 */
using BackendFactory = std::function<std::shared_ptr<RingBackend>(const Config&)>;

class BackendRegistry {
public:
    struct Entry {
        BackendKind kind;
        std::string name;
        BackendFactory factory;
    };

    /**
     * @brief Add an accelerator plugin
     * @throws InvalidParameterError for the built-in CPU kind or an empty factory
     */
    void register_backend(BackendKind kind, std::string name, BackendFactory factory);

    /**
     * @brief Registered entries, highest priority first, registration order
     *        within a kind
     */
    std::vector<Entry> candidates() const;

    size_t size() const;
    void clear();

    /**
     * @brief Process-wide table that plugins register into
     */
    static BackendRegistry& global();

private:
    mutable std::mutex mutex_;
    std::vector<Entry> entries_;
};

enum class SelectionState {
    Unselected,
    Cpu,
    Accelerator
};

class BackendDispatcher {
public:
    BackendDispatcher(const BackendRegistry& registry, Config config);

    /**
     * @brief Pick a backend, once
     *
     * Later calls return the existing choice without probing again.
     *
     * @throws BackendInitializationError if the CPU reference cannot start
     */
    std::shared_ptr<const RingBackend> select();

    SelectionState state() const { return state_; }
    std::shared_ptr<const RingBackend> selected() const { return selected_; }

    /**
     * @brief Names and failure reasons of candidates rejected during select()
     */
    const std::vector<std::string>& rejected() const { return rejected_; }

private:
    void probe_equivalence(const RingBackend& candidate, const RingBackend& reference) const;

    const BackendRegistry& registry_;
    Config config_;
    SelectionState state_ = SelectionState::Unselected;
    std::shared_ptr<const RingBackend> selected_;
    std::vector<std::string> rejected_;
};

} // namespace backend
} // namespace pqlattice
