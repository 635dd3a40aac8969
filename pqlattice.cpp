#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "src/backend/context.hpp"
#include "src/backend/dispatcher.hpp"
#include "src/core/errors.hpp"
#include "src/core/side_channel.hpp"
#include "src/pqc/kem/kem_factory.hpp"
#include "src/pqc/sig/sig_interface.hpp"
#include "src/proof/claim_ledger.hpp"

using namespace pqlattice;

// Utilities
static std::vector<uint8_t> read_all(const std::filesystem::path& p) {
    std::ifstream f(p, std::ios::binary);
    if (!f) throw std::runtime_error("open failed: " + p.string());
    f.seekg(0, std::ios::end);
    std::streamsize n = f.tellg();
    if (n < 0) n = 0;
    f.seekg(0, std::ios::beg);
    std::vector<uint8_t> buf(static_cast<size_t>(n));
    if (n > 0) f.read(reinterpret_cast<char*>(buf.data()), n);
    return buf;
}

static void write_all(const std::filesystem::path& p, const std::vector<uint8_t>& data) {
    std::ofstream f(p, std::ios::binary);
    if (!f) throw std::runtime_error("open failed: " + p.string());
    f.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
}

static void write_all_raw(const std::filesystem::path& p, const uint8_t* data, size_t n) {
    std::ofstream f(p, std::ios::binary);
    if (!f) throw std::runtime_error("open failed: " + p.string());
    f.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(n));
}

// "default" picks the build-time default level
static pqc::KEMType parse_kem_level(const std::string& s) {
    if (s == "default") return parse_kem_level(std::to_string(PQLATTICE_DEFAULT_KYBER_LEVEL));
    if (s == "512") return pqc::KEMType::KYBER_512;
    if (s == "768") return pqc::KEMType::KYBER_768;
    if (s == "1024") return pqc::KEMType::KYBER_1024;
    throw std::runtime_error("unknown Kyber level: " + s + " (expected 512, 768 or 1024)");
}

static pqc::SignatureType parse_sig_level(const std::string& s) {
    if (s == "default") return parse_sig_level(std::to_string(PQLATTICE_DEFAULT_DILITHIUM_LEVEL));
    if (s == "2") return pqc::SignatureType::DILITHIUM_2;
    if (s == "3") return pqc::SignatureType::DILITHIUM_3;
    if (s == "5") return pqc::SignatureType::DILITHIUM_5;
    throw std::runtime_error("unknown Dilithium level: " + s + " (expected 2, 3 or 5)");
}

// Usage message
static void usage() {
    std::cout <<
R"(pqlattice (C++17, libsodium, OpenSSL) - lattice KEM and signatures v)" PQLATTICE_VERSION_STRING R"(

Subcommands:

  kem-keygen <512|768|1024> <outdir>
      -> Writes kyber_pk.bin and kyber_sk.bin

  kem-encaps <512|768|1024> --pk <file> --ct-out <file> --ss-out <file>
      -> Encapsulates a fresh 32-byte shared secret to the public key

  kem-decaps <512|768|1024> --sk <file> --ct <file> --ss-out <file>
      -> Recovers the shared secret (implicit rejection on a bad ciphertext)

  sign-keygen <2|3|5> <outdir>
      -> Writes dilithium_pk.bin and dilithium_sk.bin

  sign <2|3|5> --sk <file> --in <msg> --out <sig>

  verify <2|3|5> --pk <file> --in <msg> --sig <sig>
      -> Exit status 0 if the signature is valid, 3 otherwise

  Any level may be given as "default" (Kyber-)" << std::to_string(PQLATTICE_DEFAULT_KYBER_LEVEL)
              << ", Dilithium" << std::to_string(PQLATTICE_DEFAULT_DILITHIUM_LEVEL) << R"().

  backend-report
      -> Shows the backend chosen for this process and rejected candidates

  self-test [--ledger]
      -> Round-trips every parameter set; --ledger prints the claim chain

Environment:
 - PQLATTICE_VERBOSE=1           log operations to stderr
 - PQLATTICE_FORCE_CPU=1         never select an accelerator backend
 - PQLATTICE_CPU_THREADS=<n>     worker threads for matrix products
 - PQLATTICE_MAX_SIGN_ITERATIONS cap on signing attempts
)";
}

int main(int argc, char** argv) {
    try {
        side_channel::ensure_sodium();
        if (argc < 2) { usage(); return 1; }
        std::string cmd = argv[1];

        if (cmd == "help" || cmd == "--help") {
            usage();
            return 0;
        }

        if (cmd == "kem-keygen") {
            if (argc != 4) { usage(); return 1; }
            auto kem = pqc::create_kem(parse_kem_level(argv[2]));
            std::filesystem::path outdir = argv[3];
            std::filesystem::create_directories(outdir);
            auto kp = kem->generate_keypair();
            write_all(outdir / "kyber_pk.bin", kp.public_key);
            write_all(outdir / "kyber_sk.bin", kp.secret_key);
            std::cout << "Wrote " << kem->algorithm_name() << " keys to " << outdir << "\n";
            return 0;
        }

        if (cmd == "kem-encaps" || cmd == "kem-decaps" || cmd == "sign" || cmd == "verify") {
            if (argc < 3) { usage(); return 1; }
            std::filesystem::path pk, sk, ct, ss_out, ct_out, in, out, sig;
            for (int i = 3; i < argc; ++i) {
                std::string a = argv[i];
                auto need = [&](int) {
                    if (i + 1 >= argc) throw std::runtime_error("missing value for argument: " + a);
                    return std::string(argv[++i]);
                };
                if      (a == "--pk") pk = need(1);
                else if (a == "--sk") sk = need(1);
                else if (a == "--ct") ct = need(1);
                else if (a == "--ct-out") ct_out = need(1);
                else if (a == "--ss-out") ss_out = need(1);
                else if (a == "--in") in = need(1);
                else if (a == "--out") out = need(1);
                else if (a == "--sig") sig = need(1);
                else throw std::runtime_error("unknown argument: " + a);
            }
            auto require = [](const std::filesystem::path& p, const char* flag) {
                if (p.empty()) throw std::runtime_error(std::string("missing required argument: ") + flag);
            };

            if (cmd == "kem-encaps") {
                require(pk, "--pk"); require(ct_out, "--ct-out"); require(ss_out, "--ss-out");
                auto kem = pqc::create_kem(parse_kem_level(argv[2]));
                auto result = kem->encapsulate(read_all(pk));
                write_all(ct_out, result.first.ciphertext);
                write_all_raw(ss_out, result.second.secret.data(), result.second.secret.size());
                std::cout << "Wrote " << result.first.ciphertext.size() << "-byte ciphertext to "
                          << ct_out << "\n";
                return 0;
            }

            if (cmd == "kem-decaps") {
                require(sk, "--sk"); require(ct, "--ct"); require(ss_out, "--ss-out");
                auto kem = pqc::create_kem(parse_kem_level(argv[2]));
                pqc::KEMCiphertext ciphertext;
                ciphertext.type = kem->get_type();
                ciphertext.ciphertext = read_all(ct);
                std::vector<uint8_t> secret_key = read_all(sk);
                auto ss = kem->decapsulate(ciphertext, secret_key);
                side_channel::secure_wipe(secret_key);
                write_all_raw(ss_out, ss.secret.data(), ss.secret.size());
                std::cout << "Wrote shared secret to " << ss_out << "\n";
                return 0;
            }

            if (cmd == "sign") {
                require(sk, "--sk"); require(in, "--in"); require(out, "--out");
                auto scheme = pqc::create_signature(parse_sig_level(argv[2]));
                std::vector<uint8_t> secret_key = read_all(sk);
                auto signature = scheme->sign(read_all(in), secret_key);
                side_channel::secure_wipe(secret_key);
                write_all(out, signature);
                std::cout << "Wrote " << signature.size() << "-byte signature to " << out << "\n";
                return 0;
            }

            require(pk, "--pk"); require(in, "--in"); require(sig, "--sig");
            auto scheme = pqc::create_signature(parse_sig_level(argv[2]));
            if (scheme->verify(read_all(in), read_all(sig), read_all(pk))) {
                std::cout << "OK: valid " << scheme->algorithm_name() << " signature\n";
                return 0;
            }
            std::cout << "FAIL: signature does not verify\n";
            return 3;
        }

        if (cmd == "sign-keygen") {
            if (argc != 4) { usage(); return 1; }
            auto scheme = pqc::create_signature(parse_sig_level(argv[2]));
            std::filesystem::path outdir = argv[3];
            std::filesystem::create_directories(outdir);
            auto kp = scheme->generate_keypair();
            write_all(outdir / "dilithium_pk.bin", kp.public_key);
            write_all(outdir / "dilithium_sk.bin", kp.secret_key);
            std::cout << "Wrote " << scheme->algorithm_name() << " keys to " << outdir << "\n";
            return 0;
        }

        if (cmd == "backend-report") {
            if (argc != 2) { usage(); return 1; }
            Config cfg = Config::from_environment();
            backend::BackendDispatcher dispatcher(backend::BackendRegistry::global(), cfg);
            auto chosen = dispatcher.select();
            std::cout << "Backend selection:\n";
            std::cout << "  Selected:    " << chosen->name() << " ("
                      << backend::backend_kind_name(chosen->kind()) << ")\n";
            std::cout << "  Registered:  " << backend::BackendRegistry::global().size()
                      << " accelerator plugin(s)\n";
            std::cout << "  Accelerators " << (cfg.enable_accelerators ? "enabled" : "disabled")
                      << ", validation " << (cfg.validate_accelerators ? "on" : "off") << "\n";
            for (const auto& r : dispatcher.rejected()) {
                std::cout << "  Rejected:    " << r << "\n";
            }
            return 0;
        }

        if (cmd == "self-test") {
            bool show_ledger = (argc == 3 && std::string(argv[2]) == "--ledger");
            if (argc > 3 || (argc == 3 && !show_ledger)) { usage(); return 1; }

            std::cout << "Running pqlattice self-test...\n";
            auto ledger = std::make_shared<proof::ClaimLedger>();
            Context ctx = Context::process_default().with_exporter(ledger);

            std::cout << "  Testing key encapsulation...\n";
            for (auto type : {pqc::KEMType::KYBER_512, pqc::KEMType::KYBER_768, pqc::KEMType::KYBER_1024}) {
                auto kem = pqc::create_kem(type, ctx);
                auto kp = kem->generate_keypair();
                auto enc = kem->encapsulate(kp.public_key);
                auto dec = kem->decapsulate(enc.first, kp.secret_key);
                if (!side_channel::constant_time_compare(enc.second.secret.data(), dec.secret.data(),
                                                         dec.secret.size())) {
                    throw std::runtime_error(kem->algorithm_name() + " round trip failed");
                }
                std::cout << "     " << kem->algorithm_name() << "\n";
            }

            std::cout << "  Testing digital signatures...\n";
            const std::vector<uint8_t> msg = {'s', 'e', 'l', 'f', '-', 't', 'e', 's', 't'};
            for (auto type : {pqc::SignatureType::DILITHIUM_2, pqc::SignatureType::DILITHIUM_3,
                              pqc::SignatureType::DILITHIUM_5}) {
                auto scheme = pqc::create_signature(type, ctx);
                auto kp = scheme->generate_keypair();
                auto signature = scheme->sign(msg, kp.secret_key);
                if (!scheme->verify(msg, signature, kp.public_key)) {
                    throw std::runtime_error(scheme->algorithm_name() + " verification failed");
                }
                signature[signature.size() / 2] ^= 0x01;
                if (scheme->verify(msg, signature, kp.public_key)) {
                    throw std::runtime_error(scheme->algorithm_name() + " accepted a tampered signature");
                }
                std::cout << "     " << scheme->algorithm_name() << "\n";
            }

            std::cout << "  Testing claim ledger...\n";
            if (!ledger->verify_chain()) {
                throw std::runtime_error("claim ledger chain does not verify");
            }
            std::cout << "     " << ledger->size() << " claims chained\n";
            if (show_ledger) {
                for (const auto& r : ledger->records()) {
                    std::cout << "    #" << r.sequence_number << " " << r.claim.subject << " "
                              << r.claim.parameter_set << " "
                              << proof::ClaimLedger::hex_encode(r.current_hash.data(), r.current_hash.size())
                              << "\n";
                }
            }

            std::cout << "Self-test passed.\n";
            return 0;
        }

        usage();
        return 1;
    } catch (const SigningExhaustedError& e) {
        std::cerr << "ERR: " << e.what() << "\n";
        return 4;
    } catch (const std::exception& e) {
        std::cerr << "ERR: " << e.what() << "\n";
        return 2;
    }
}
