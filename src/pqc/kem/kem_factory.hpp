/**
 * @file kem_factory.hpp
 * @brief Factory pattern for creating KEM instances
 *
 * @version 1.0.0
 */

#pragma once

#include "kem_interface.hpp"
#include "../params.hpp"

#include <memory>
#include <string>

namespace pqlattice {
namespace pqc {

/**
 * @brief Factory for creating KEM instances
 *
 * Usage:
 * @code
 * KEMFactory factory(Context::process_default());
 * auto kem = factory.create(KEMType::KYBER_768);
 * auto keypair = kem->generate_keypair();
 * @endcode
 */
class KEMFactory {
public:
    explicit KEMFactory(const Context& ctx) : ctx_(ctx) {}

    /**
     * @throws InvalidParameterError if type is not recognized
     */
    std::unique_ptr<KEMInterface> create(KEMType type) const;

    static bool is_available(KEMType type);

    /**
     * @brief Parameter summary for a KEM type
     */
    static std::string get_description(KEMType type);

    /**
     * @throws InvalidParameterError if type is not recognized
     */
    static KyberLevel level_of(KEMType type);

private:
    Context ctx_;
};

} // namespace pqc
} // namespace pqlattice
