#include <boost/program_options.hpp>
#include <tessera/blake3/hash.hpp>
#include <tessera/common/critical.hpp>
#include <tessera/crypto/identity.hpp>
#include <tessera/schema/encoding/scale/encoder.hpp>
#include <tessera/schema/genesis.hpp>
#include <tessera/schema/transaction.hpp>

#include <algorithm>
#include <array>
#include <cstdint>
#include <iostream>
#include <iterator>
#include <string>
#include <string_view>
#include <tuple>

namespace {

using encoder_t = tessera::schema::encoding::scale_encoder_t;
namespace po = boost::program_options;

inline constexpr auto kDefaultChain = std::string_view{"tessera-local-chain"};

tessera::schema::hash32_t get_hash32(const po::variables_map& vm,
                                     const std::string& name) {
  if (!vm.contains(name)) {
    tessera::common::critical("missing required hash argument");
  }
  auto hash = tessera::schema::try_make_hash32(vm[name].as<std::string>());
  if (!hash) {
    tessera::common::critical("hash arguments must be 64 hex characters");
  }
  return *hash;
}

tessera::schema::amount_t get_amount(const po::variables_map& vm) {
  auto amount =
      tessera::schema::try_parse_amount(vm["amount"].as<std::string>());
  if (!amount) {
    tessera::common::critical("amount must be a decimal uint256");
  }
  return *amount;
}

template <size_t Size>
std::array<uint8_t, Size> get_fixed_hex(const std::string& hex,
                                        std::string_view message) {
  auto bytes = tessera::schema::try_from_hex(hex);
  auto out = std::array<uint8_t, Size>{};
  if (!bytes || bytes->size() != Size) {
    tessera::common::critical(message);
  }
  std::copy(std::begin(*bytes), std::end(*bytes), std::begin(out));
  return out;
}

tessera::schema::signer_id_t make_signer(const po::variables_map& vm) {
  if (!vm.contains("signer")) {
    tessera::common::critical("missing --signer");
  }
  auto kind = vm["signer-kind"].as<std::string>();
  auto value = vm["signer"].as<std::string>();
  if (kind == "named") {
    return tessera::schema::signer_id_t{get_hash32(vm, "signer")};
  }
  if (kind == "ed25519") {
    return tessera::schema::ed25519_signer_id{
        .public_key = get_fixed_hex<32>(
            value, "ed25519 signer must be a 32-byte public key")};
  }
  if (kind == "secp256k1") {
    return tessera::schema::secp256k1_signer_id{
        .public_key = get_fixed_hex<33>(
            value, "secp256k1 signer must be a 33-byte compressed key")};
  }
  tessera::common::critical("signer-kind must be named|ed25519|secp256k1");
}

tessera::schema::signature_t make_signature(const po::variables_map& vm) {
  auto kind = vm["signature-kind"].as<std::string>();
  auto hex = vm["signature-hex"].as<std::string>();
  if (kind == "ed25519") {
    if (hex.empty()) {
      return tessera::schema::ed25519_signature_t{};
    }
    return get_fixed_hex<64>(hex, "ed25519 signature must be 64 bytes");
  }
  if (kind == "secp256k1") {
    if (hex.empty()) {
      return tessera::schema::secp256k1_signature_t{};
    }
    return get_fixed_hex<65>(hex, "secp256k1 signature must be 65 bytes");
  }
  tessera::common::critical("unsupported signature-kind");
}

tessera::schema::hash32_t get_chain_id(const po::variables_map& vm) {
  if (vm.contains("chain-id")) {
    return get_hash32(vm, "chain-id");
  }
  return tessera::blake3::hash(vm["chain"].as<std::string>());
}

tessera::schema::transaction_payload_t build_payload(
    const po::variables_map& vm) {
  auto payload = vm["payload"].as<std::string>();
  if (payload == "transfer") {
    return tessera::schema::transfer_t{.to = get_hash32(vm, "to"),
                                       .amount = get_amount(vm)};
  }
  if (payload == "approve") {
    return tessera::schema::approve_t{.spender = get_hash32(vm, "spender"),
                                      .amount = get_amount(vm)};
  }
  if (payload == "transfer_from") {
    return tessera::schema::transfer_from_t{.from = get_hash32(vm, "from"),
                                            .to = get_hash32(vm, "to"),
                                            .amount = get_amount(vm)};
  }
  if (payload == "mint") {
    return tessera::schema::mint_t{.to = get_hash32(vm, "to"),
                                   .amount = get_amount(vm)};
  }
  if (payload == "burn") {
    return tessera::schema::burn_t{.amount = get_amount(vm)};
  }
  if (payload == "pause") {
    return tessera::schema::pause_t{};
  }
  if (payload == "unpause") {
    return tessera::schema::unpause_t{};
  }
  if (payload == "set_asset_info") {
    return tessera::schema::set_asset_info_t{.uri = vm["uri"].as<std::string>()};
  }
  if (payload == "transfer_ownership") {
    return tessera::schema::transfer_ownership_t{
        .new_owner = get_hash32(vm, "new-owner")};
  }
  if (payload == "renounce_ownership") {
    return tessera::schema::renounce_ownership_t{};
  }
  tessera::common::critical("unsupported payload type");
}

tessera::schema::transaction_t build_transaction(const po::variables_map& vm) {
  if (!vm.contains("payload")) {
    tessera::common::critical("transaction mode requires --payload");
  }
  return tessera::schema::transaction_t{.version = 1,
                                        .chain_id = get_chain_id(vm),
                                        .nonce = vm["nonce"].as<uint64_t>(),
                                        .signer = make_signer(vm),
                                        .payload = build_payload(vm),
                                        .signature = make_signature(vm)};
}

tessera::schema::bytes_t build_query_key(const po::variables_map& vm) {
  auto encoder = encoder_t{};
  auto path = vm["path"].as<std::string>();
  if (path == "/engine/info" || path == "/token/info" ||
      path == "/token/owner" || path == "/token/asset_info" ||
      path == "/token/total_supply" || path == "/token/max_supply" ||
      path == "/token/paused") {
    return {};
  }
  if (path == "/token/balance") {
    return encoder.encode(get_hash32(vm, "account"));
  }
  if (path == "/token/allowance") {
    return encoder.encode(
        std::tuple{get_hash32(vm, "owner"), get_hash32(vm, "spender")});
  }
  if (path == "/nonce") {
    return encoder.encode(make_signer(vm));
  }
  if (path == "/history/range") {
    return encoder.encode(std::tuple{vm["from-height"].as<uint64_t>(),
                                     vm["to-height"].as<uint64_t>()});
  }
  tessera::common::critical("unsupported query path");
}

tessera::schema::genesis_t build_genesis(const po::variables_map& vm) {
  auto initial_supply = tessera::schema::try_parse_amount(
      vm["initial-supply"].as<std::string>());
  auto max_supply =
      tessera::schema::try_parse_amount(vm["max-supply"].as<std::string>());
  if (!initial_supply || !max_supply) {
    tessera::common::critical("supplies must be decimal uint256 values");
  }
  return tessera::schema::genesis_t{.name = vm["name"].as<std::string>(),
                                    .symbol = vm["symbol"].as<std::string>(),
                                    .initial_supply = *initial_supply,
                                    .max_supply = *max_supply,
                                    .creator = get_hash32(vm, "creator")};
}

void print_help(const po::options_description& options) {
  std::cout << "Usage:\n"
            << "  tessera_transaction_builder transaction [options]\n"
            << "  tessera_transaction_builder signing-bytes [options]\n"
            << "  tessera_transaction_builder query-key [options]\n"
            << "  tessera_transaction_builder genesis [options]\n"
            << "  tessera_transaction_builder account [options]\n"
            << "  tessera_transaction_builder chain-id [--chain NAME]\n\n";
  std::cout << options << '\n';
}

}  // namespace

int main(int argc, const char** argv) {
  auto command = std::string{};
  auto options = po::options_description{"tessera_transaction_builder options"};
  options.add_options()("help,h", "show help")(
      "command", po::value<std::string>(&command),
      "transaction|signing-bytes|query-key|genesis|account|chain-id")(
      "payload", po::value<std::string>(),
      "transfer|approve|transfer_from|mint|burn|pause|unpause|set_asset_info|"
      "transfer_ownership|renounce_ownership")(
      "path", po::value<std::string>(), "abci query path")(
      "chain-id", po::value<std::string>(), "32-byte chain id hex")(
      "chain",
      po::value<std::string>()->default_value(std::string{kDefaultChain}),
      "chain id string, hashed when --chain-id is absent")(
      "nonce", po::value<uint64_t>()->default_value(1), "transaction nonce")(
      "signer", po::value<std::string>(), "signer hash32 or public key hex")(
      "signer-kind", po::value<std::string>()->default_value("named"),
      "named|ed25519|secp256k1")(
      "signature-kind", po::value<std::string>()->default_value("ed25519"),
      "ed25519|secp256k1")("signature-hex",
                           po::value<std::string>()->default_value(""),
                           "signature bytes hex")(
      "to", po::value<std::string>(), "recipient account hex")(
      "from", po::value<std::string>(), "debited account hex")(
      "spender", po::value<std::string>(), "spender account hex")(
      "owner", po::value<std::string>(), "allowance owner account hex")(
      "account", po::value<std::string>(), "account hex for balance queries")(
      "new-owner", po::value<std::string>(), "new owner account hex")(
      "amount", po::value<std::string>()->default_value("0"),
      "decimal token amount")("uri", po::value<std::string>()->default_value(""),
                              "asset info pointer")(
      "name", po::value<std::string>()->default_value(""), "genesis name")(
      "symbol", po::value<std::string>()->default_value(""), "genesis symbol")(
      "initial-supply", po::value<std::string>()->default_value("0"),
      "genesis initial supply")("max-supply",
                                po::value<std::string>()->default_value("0"),
                                "genesis max supply")(
      "creator", po::value<std::string>(), "genesis creator account hex")(
      "from-height", po::value<uint64_t>()->default_value(1),
      "history range from")(
      "to-height", po::value<uint64_t>()->default_value(1), "history range to");

  auto positional = po::positional_options_description{};
  positional.add("command", 1);
  auto vm = po::variables_map{};
  po::store(po::command_line_parser(argc, argv)
                .options(options)
                .positional(positional)
                .run(),
            vm);
  po::notify(vm);

  if (vm.contains("help") || command.empty()) {
    print_help(options);
    return 0;
  }

  if (command == "transaction" || command == "tx") {
    auto encoded = encoder_t{}.encode(build_transaction(vm));
    std::cout << tessera::schema::to_base64(encoded) << '\n';
    return 0;
  }

  if (command == "signing-bytes") {
    auto bytes = tessera::crypto::signing_bytes(build_transaction(vm));
    std::cout << tessera::schema::to_hex(tessera::schema::bytes_view_t{bytes})
              << '\n';
    return 0;
  }

  if (command == "query-key") {
    if (!vm.contains("path")) {
      tessera::common::critical("query-key mode requires --path");
    }
    std::cout << tessera::schema::to_base64(build_query_key(vm)) << '\n';
    return 0;
  }

  if (command == "genesis") {
    auto encoded = encoder_t{}.encode(build_genesis(vm));
    std::cout << tessera::schema::to_base64(encoded) << '\n';
    return 0;
  }

  if (command == "account") {
    std::cout << tessera::schema::to_hex(
                     tessera::crypto::account_of(make_signer(vm)))
              << '\n';
    return 0;
  }

  if (command == "chain-id") {
    std::cout << tessera::schema::to_hex(
                     tessera::blake3::hash(vm["chain"].as<std::string>()))
              << '\n';
    return 0;
  }

  tessera::common::critical(
      "command must be "
      "transaction|signing-bytes|query-key|genesis|account|chain-id");
}
