#include "context.hpp"
#include "cpu_backend.hpp"
#include "../core/errors.hpp"

#include <iostream>
#include <utility>

namespace pqlattice {

Context::Context(Config config,
                 std::shared_ptr<const backend::RingBackend> backend,
                 std::shared_ptr<proof::ProofExporter> exporter)
    : config_(config), backend_(std::move(backend)), exporter_(std::move(exporter)) {
    if (!backend_) {
        throw InvalidParameterError("context requires a backend");
    }
}

Context Context::create(const Config& config,
                        const backend::BackendRegistry& registry,
                        std::shared_ptr<proof::ProofExporter> exporter) {
    backend::BackendDispatcher dispatcher(registry, config);
    return Context(config, dispatcher.select(), std::move(exporter));
}

Context Context::cpu(const Config& config) {
    return Context(config, std::make_shared<backend::CpuBackend>(config.cpu_threads));
}

const Context& Context::process_default() {
    static const Context context = create(Config::from_environment());
    return context;
}

Context Context::with_exporter(std::shared_ptr<proof::ProofExporter> exporter) const {
    return Context(config_, backend_, std::move(exporter));
}

void Context::log(const std::string& message) const {
    if (config_.verbose_logging) {
        std::cerr << "[PQC] " << message << std::endl;
    }
}

proof::CertificateHandle Context::export_claim(const proof::CorrectnessClaim& claim) const {
    if (!exporter_) {
        return {};
    }
    try {
        proof::CertificateHandle handle = exporter_->submit(claim);
        log("exported claim " + claim.subject + " (" + claim.parameter_set + ") to " +
            exporter_->exporter_name());
        return handle;
    } catch (const std::exception& e) {
        std::cerr << "[PQC] WARNING: proof exporter " << exporter_->exporter_name()
                  << " rejected claim " << claim.subject << ": " << e.what() << std::endl;
        return {};
    }
}

} // namespace pqlattice
