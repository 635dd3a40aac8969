#include "dispatcher.hpp"
#include "cpu_backend.hpp"
#include "../core/errors.hpp"
#include "../sampling/sampler.hpp"

#include <algorithm>
#include <iostream>

namespace pqlattice {
namespace backend {

void BackendRegistry::register_backend(BackendKind kind, std::string name, BackendFactory factory) {
    if (kind == BackendKind::CpuSimd) {
        throw InvalidParameterError("the CPU reference backend is built in and cannot be registered");
    }
    if (!factory) {
        throw InvalidParameterError("backend " + name + " registered without a factory");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.push_back(Entry{kind, std::move(name), std::move(factory)});
}

std::vector<BackendRegistry::Entry> BackendRegistry::candidates() const {
    std::vector<Entry> sorted;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        sorted = entries_;
    }
    std::stable_sort(sorted.begin(), sorted.end(), [](const Entry& a, const Entry& b) {
        return backend_priority(a.kind) > backend_priority(b.kind);
    });
    return sorted;
}

size_t BackendRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

void BackendRegistry::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
}

BackendRegistry& BackendRegistry::global() {
    static BackendRegistry registry;
    return registry;
}

BackendDispatcher::BackendDispatcher(const BackendRegistry& registry, Config config)
    : registry_(registry), config_(config) {}

std::shared_ptr<const RingBackend> BackendDispatcher::select() {
    if (state_ != SelectionState::Unselected) {
        return selected_;
    }

    // CPU failure is not recoverable and propagates to the caller
    auto reference = std::make_shared<CpuBackend>(config_.cpu_threads);

    if (config_.enable_accelerators) {
        for (const auto& entry : registry_.candidates()) {
            std::string failure;
            try {
                std::shared_ptr<RingBackend> candidate = entry.factory(config_);
                if (!candidate) {
                    throw BackendInitializationError(entry.name, "factory returned no backend");
                }
                if (config_.validate_accelerators) {
                    probe_equivalence(*candidate, *reference);
                }
                selected_ = candidate;
                state_ = SelectionState::Accelerator;
                if (config_.verbose_logging) {
                    std::cerr << "[backend] selected " << backend_kind_name(entry.kind)
                              << " backend " << candidate->name() << std::endl;
                }
                return selected_;
            } catch (const BackendInitializationError& e) {
                failure = e.what();
            } catch (const std::exception& e) {
                failure = BackendInitializationError(entry.name, e.what()).what();
            }
            rejected_.push_back(failure);
            std::cerr << "[backend] WARNING: " << failure
                      << "; falling through to next candidate" << std::endl;
        }
    }

    selected_ = reference;
    state_ = SelectionState::Cpu;
    if (config_.verbose_logging) {
        std::cerr << "[backend] selected " << reference->name() << std::endl;
    }
    return selected_;
}

void BackendDispatcher::probe_equivalence(const RingBackend& candidate,
                                          const RingBackend& reference) const {
    sampling::Seed seed;
    seed.fill(0xA5);

    for (const ring::Ring* r : {&ring::Ring::kyber(), &ring::Ring::dilithium()}) {
        ring::PolyMatrix expected_matrix = reference.sample(*r, seed, 2, 3);
        ring::PolyVec input{sampling::sample_cbd(*r, seed, 0, 2),
                            sampling::sample_cbd(*r, seed, 1, 2)};
        ring::PolyVec expected_ntt = input;
        reference.ntt_transform(*r, expected_ntt);
        ring::PolyVec expected_product = reference.lattice_multiply(*r, expected_matrix, expected_ntt, true);
        ring::Poly expected_pointwise = reference.polynomial_multiply(*r, expected_ntt[0], expected_ntt[1]);
        ring::PolyVec expected_inverse = expected_product;
        reference.inverse_ntt_transform(*r, expected_inverse);

        ring::PolyMatrix actual_matrix;
        ring::PolyVec actual_ntt = input;
        ring::PolyVec actual_product;
        ring::Poly actual_pointwise;
        ring::PolyVec actual_inverse = expected_product;
        try {
            actual_matrix = candidate.sample(*r, seed, 2, 3);
            candidate.ntt_transform(*r, actual_ntt);
            actual_product = candidate.lattice_multiply(*r, expected_matrix, expected_ntt, true);
            actual_pointwise = candidate.polynomial_multiply(*r, expected_ntt[0], expected_ntt[1]);
            candidate.inverse_ntt_transform(*r, actual_inverse);
        } catch (const std::exception& e) {
            throw BackendInitializationError(candidate.name(),
                                             std::string("known-answer probe raised: ") + e.what());
        }

        const char* mismatch = nullptr;
        if (actual_matrix != expected_matrix) mismatch = "sample";
        else if (actual_ntt != expected_ntt) mismatch = "ntt_transform";
        else if (actual_product != expected_product) mismatch = "lattice_multiply";
        else if (actual_pointwise != expected_pointwise) mismatch = "polynomial_multiply";
        else if (actual_inverse != expected_inverse) mismatch = "inverse_ntt_transform";

        if (mismatch != nullptr) {
            throw BackendInitializationError(candidate.name(),
                                             std::string(mismatch) + " differs from CPU reference on " +
                                             r->name());
        }
    }
}

} // namespace backend
} // namespace pqlattice
