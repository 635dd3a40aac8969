/**
 * @file context.hpp
 * @brief Immutable execution context passed into every KEM and signature call
 *
 * A Context bundles the runtime Config, the backend chosen by
 * BackendDispatcher and an optional proof exporter. It is built once and
 * only read afterwards, so one Context may be shared across threads.
 *
 * @version 1.0.0
 */

#pragma once

#include "backend.hpp"
#include "dispatcher.hpp"
#include "../pqlattice_config.hpp"
#include "../proof/proof_export.hpp"

#include <memory>
#include <string>

namespace pqlattice {

class Context {
public:
    /**
     * @throws InvalidParameterError if backend is null
     */
    Context(Config config,
            std::shared_ptr<const backend::RingBackend> backend,
            std::shared_ptr<proof::ProofExporter> exporter = nullptr);

    /**
     * @brief Run backend selection against a registry and wrap the result
     */
    static Context create(const Config& config,
                          const backend::BackendRegistry& registry = backend::BackendRegistry::global(),
                          std::shared_ptr<proof::ProofExporter> exporter = nullptr);

    /**
     * @brief CPU-only context, no exporter
     */
    static Context cpu(const Config& config = Config::defaults());

    /**
     * @brief Shared context built on first use from Config::from_environment()
     *        and the global registry
     */
    static const Context& process_default();

    const Config& config() const { return config_; }
    const backend::RingBackend& backend() const { return *backend_; }
    std::shared_ptr<const backend::RingBackend> backend_ptr() const { return backend_; }
    proof::ProofExporter* exporter() const { return exporter_.get(); }

    /**
     * @brief Copy of this context with a different exporter
     */
    Context with_exporter(std::shared_ptr<proof::ProofExporter> exporter) const;

    /**
     * @brief Write "[PQC] message" to stderr when verbose logging is on
     */
    void log(const std::string& message) const;

    /**
     * @brief Hand a claim to the exporter, if any
     *
     * Exporter failures are logged and otherwise ignored; the returned handle
     * is empty in that case or when no exporter is attached.
     */
    proof::CertificateHandle export_claim(const proof::CorrectnessClaim& claim) const;

private:
    Config config_;
    std::shared_ptr<const backend::RingBackend> backend_;
    std::shared_ptr<proof::ProofExporter> exporter_;
};

} // namespace pqlattice
