#include <spdlog/spdlog.h>
#include <algorithm>
#include <tessera/blake3/hash.hpp>
#include <tessera/crypto/identity.hpp>
#include <tessera/crypto/verify.hpp>
#include <tessera/execution/engine.hpp>
#include <tessera/schema/key/engine_keys.hpp>
#include <tessera/schema/query_error_code.hpp>
#include <tessera/schema/token_event.hpp>
#include <tessera/token/token.hpp>
#include <iterator>
#include <tuple>
#include <utility>

using namespace tessera::schema;

namespace {

inline constexpr auto kInitCodespace = std::string_view{"tessera.init"};
inline constexpr auto kCheckTxCodespace = std::string_view{"tessera.checktx"};
inline constexpr auto kProposalCodespace =
    std::string_view{"tessera.proposal"};
inline constexpr auto kFinalizeCodespace =
    std::string_view{"tessera.finalize"};
inline constexpr auto kQueryCodespace = std::string_view{"tessera.query"};

transaction_result_t make_failure(const transaction_error_code code,
                                  const std::string_view codespace,
                                  std::string info = {}) {
  auto result = transaction_result_t{};
  result.code = static_cast<uint32_t>(code);
  result.log = std::string{to_string(code)};
  result.info = std::move(info);
  result.codespace = std::string{codespace};
  return result;
}

query_result_t make_query_failure(query_result_t result,
                                  const query_error_code code,
                                  std::string log) {
  result.code = static_cast<uint32_t>(code);
  result.log = std::move(log);
  result.codespace = std::string{kQueryCodespace};
  return result;
}

std::string_view payload_name(const transaction_payload_t& payload) {
  return std::visit(
      overloaded{[](const transfer_t&) { return std::string_view{"transfer"}; },
                 [](const approve_t&) { return std::string_view{"approve"}; },
                 [](const transfer_from_t&) {
                   return std::string_view{"transfer_from"};
                 },
                 [](const mint_t&) { return std::string_view{"mint"}; },
                 [](const burn_t&) { return std::string_view{"burn"}; },
                 [](const pause_t&) { return std::string_view{"pause"}; },
                 [](const unpause_t&) { return std::string_view{"unpause"}; },
                 [](const set_asset_info_t&) {
                   return std::string_view{"set_asset_info"};
                 },
                 [](const transfer_ownership_t&) {
                   return std::string_view{"transfer_ownership"};
                 },
                 [](const renounce_ownership_t&) {
                   return std::string_view{"renounce_ownership"};
                 }},
      payload);
}

bool signature_matches_signer(const signer_id_t& signer,
                              const signature_t& signature) {
  return std::visit(
      overloaded{[&](const ed25519_signer_id&) {
                   return std::holds_alternative<ed25519_signature_t>(
                       signature);
                 },
                 [&](const secp256k1_signer_id&) {
                   return std::holds_alternative<secp256k1_signature_t>(
                       signature);
                 },
                 [](const named_signer_t&) { return false; }},
      signer);
}

token_record_t make_token_record(const token_state_t& state) {
  return token_record_t{.name = state.name,
                        .symbol = state.symbol,
                        .decimals = state.decimals,
                        .total_supply = state.total_supply,
                        .max_supply = state.max_supply,
                        .owner = state.owner,
                        .state = state.state,
                        .asset_info = state.asset_info};
}

token_state_t make_token_state(const token_record_t& record) {
  auto state = token_state_t{};
  state.name = record.name;
  state.symbol = record.symbol;
  state.decimals = record.decimals;
  state.total_supply = record.total_supply;
  state.max_supply = record.max_supply;
  state.owner = record.owner;
  state.state = record.state;
  state.asset_info = record.asset_info;
  return state;
}

uint64_t next_nonce(const tessera::execution::nonce_table_t& nonces,
                    const account_id_t& account) {
  auto it = nonces.find(account);
  if (it == std::end(nonces)) {
    return 1;
  }
  return it->second + 1;
}

}  // namespace

namespace tessera::execution {

engine::engine(encoder_t& encoder,
               storage_t& storage,
               const bool require_strict_crypto)
    : encoder_{encoder},
      storage_{storage},
      require_strict_crypto_{require_strict_crypto} {
  auto lock = std::scoped_lock{mutex_};
  if (require_strict_crypto_) {
    if (!tessera::crypto::available()) {
      spdlog::warn(
          "OpenSSL lacks ed25519 or secp256k1; key signatures will fail");
    }
    signature_verifier_ = tessera::crypto::verify_signature;
  } else {
    spdlog::warn("Strict crypto disabled; signatures are not verified");
  }
  load_persisted_state();
  spdlog::info("Execution engine ready at height {} (token {})",
               last_committed_height_,
               committed_token_.has_value() ? "initialized" : "absent");
}

transaction_result_t engine::init_chain(const std::string_view chain_id,
                                        const genesis_t& genesis) {
  auto lock = std::scoped_lock{mutex_};
  if (committed_token_.has_value()) {
    return make_failure(transaction_error_code::token_already_initialized,
                        kInitCodespace);
  }

  auto token = token_state_t{};
  auto events = tessera::token::events_t{};
  if (auto failed = tessera::token::initialize(token, genesis, events)) {
    spdlog::error("Rejected genesis for token '{}': {}", genesis.name,
                  to_string(failed.value()));
    return make_failure(failed.value(), kInitCodespace);
  }

  chain_id_ = tessera::blake3::hash(chain_id);
  committed_token_ = std::move(token);
  committed_nonces_.clear();
  last_committed_height_ = 0;
  last_committed_state_root_ =
      compute_state_root(committed_token_, committed_nonces_);

  auto block = tessera::storage::block_write{};
  block.state_rows = make_state_rows(committed_token_, committed_nonces_);
  block.appended_rows.push_back(tessera::storage::key_value_entry_t{
      key::make_chain_id_key(), encoder_.encode(chain_id_)});
  block.committed =
      tessera::storage::committed_state{.height = last_committed_height_,
                                        .state_root = last_committed_state_root_};
  storage_.write_block(make_bytes_view(key::kStatePrefix), block);

  auto result = transaction_result_t{};
  result.info = "token initialized";
  for (const auto& event : events) {
    result.events.push_back(make_transaction_event(event));
  }
  spdlog::info("Initialized token '{}' ({}) on chain '{}' with supply {}/{}",
               committed_token_->name, committed_token_->symbol, chain_id,
               to_string(committed_token_->total_supply),
               to_string(committed_token_->max_supply));
  return result;
}

transaction_result_t engine::check_transaction(const bytes_view_t& raw_tx) {
  auto lock = std::scoped_lock{mutex_};
  auto result = transaction_result_t{};
  if (!validate_transaction(raw_tx, kCheckTxCodespace, committed_nonces_,
                            result)) {
    spdlog::debug("CheckTx rejected transaction: {}", result.log);
  }
  return result;
}

transaction_result_t engine::process_proposal_transaction(
    const bytes_view_t& raw_tx) {
  auto lock = std::scoped_lock{mutex_};
  auto result = transaction_result_t{};
  if (!validate_transaction(raw_tx, kProposalCodespace, committed_nonces_,
                            result)) {
    spdlog::debug("Proposal rejected transaction: {}", result.log);
  }
  return result;
}

block_result_t engine::finalize_block(const uint64_t height,
                                      const std::vector<bytes_t>& txs) {
  auto lock = std::scoped_lock{mutex_};
  pending_token_ = committed_token_;
  pending_nonces_ = committed_nonces_;
  pending_history_.clear();

  auto result = block_result_t{};
  result.height = static_cast<int64_t>(height);
  result.tx_results.reserve(txs.size());

  for (size_t i = 0; i < txs.size(); ++i) {
    auto tx_result = transaction_result_t{};
    auto validated = validate_transaction(make_bytes_view(txs[i]),
                                          kFinalizeCodespace, pending_nonces_,
                                          tx_result);
    if (validated.has_value()) {
      // The nonce is spent once the envelope is valid, even if the token
      // operation is rejected below.
      pending_nonces_[validated->caller] = validated->tx.nonce;
      tx_result = execute_operation(validated.value());
    } else {
      spdlog::debug("Block {} tx {} rejected: {}", height, i, tx_result.log);
    }
    pending_history_.push_back(
        history_entry_t{.height = height,
                        .index = static_cast<uint32_t>(i),
                        .code = tx_result.code,
                        .tx = txs[i]});
    result.tx_results.push_back(std::move(tx_result));
  }

  has_pending_block_ = true;
  pending_height_ = static_cast<int64_t>(height);
  pending_state_root_ = compute_state_root(pending_token_, pending_nonces_);
  result.state_root = pending_state_root_;
  return result;
}

commit_result_t engine::commit() {
  auto lock = std::scoped_lock{mutex_};
  if (has_pending_block_) {
    auto block = tessera::storage::block_write{};
    block.state_rows = make_state_rows(pending_token_, pending_nonces_);
    block.appended_rows.reserve(pending_history_.size());
    for (const auto& entry : pending_history_) {
      block.appended_rows.push_back(tessera::storage::key_value_entry_t{
          key::make_history_key(entry.height, entry.index),
          encoder_.encode(entry)});
    }
    block.committed =
        tessera::storage::committed_state{.height = pending_height_,
                                          .state_root = pending_state_root_};
    storage_.write_block(make_bytes_view(key::kStatePrefix), block);

    last_committed_height_ = pending_height_;
    last_committed_state_root_ = pending_state_root_;
    committed_token_ = std::move(pending_token_);
    committed_nonces_ = std::move(pending_nonces_);
    pending_token_.reset();
    pending_nonces_.clear();
    pending_history_.clear();
    has_pending_block_ = false;
    spdlog::info("Committed height {} state root {}", last_committed_height_,
                 to_hex(last_committed_state_root_));
  }

  auto result = commit_result_t{};
  result.retain_height = 0;
  result.committed_height = last_committed_height_;
  result.state_root = last_committed_state_root_;
  return result;
}

app_info_t engine::info() const {
  auto lock = std::scoped_lock{mutex_};
  auto result = app_info_t{};
  result.last_block_height = last_committed_height_;
  result.last_block_state_root = last_committed_state_root_;
  return result;
}

query_result_t engine::query(const std::string_view path,
                             const bytes_view_t& data) {
  auto lock = std::scoped_lock{mutex_};
  auto result = query_result_t{};
  result.key = make_bytes(data);
  result.height = last_committed_height_;

  if (path == "/engine/info") {
    result.value = encoder_.encode(std::tuple{
        last_committed_height_, last_committed_state_root_, chain_id_});
    return result;
  }
  if (path == "/nonce") {
    auto signer = encoder_.try_decode<signer_id_t>(data);
    if (!signer.has_value()) {
      return make_query_failure(std::move(result),
                                query_error_code::invalid_key,
                                "expected SCALE signer id");
    }
    auto account = tessera::crypto::account_of(signer.value());
    result.value = encoder_.encode(next_nonce(committed_nonces_, account));
    return result;
  }
  if (path == "/history/range") {
    auto range = encoder_.try_decode<std::tuple<uint64_t, uint64_t>>(data);
    if (!range.has_value()) {
      return make_query_failure(std::move(result),
                                query_error_code::invalid_key,
                                "expected SCALE (from_height, to_height)");
    }
    result.value = encoder_.encode(
        load_history(std::get<0>(range.value()), std::get<1>(range.value())));
    return result;
  }
  if (path.starts_with("/token/")) {
    return query_token(path, data, std::move(result));
  }
  return make_query_failure(std::move(result),
                            query_error_code::unsupported_path,
                            "unsupported query path");
}

query_result_t engine::query_token(const std::string_view path,
                                   const bytes_view_t& data,
                                   query_result_t result) {
  if (!committed_token_.has_value()) {
    return make_query_failure(std::move(result), query_error_code::not_found,
                              "token not initialized");
  }
  const auto& token = committed_token_.value();

  if (path == "/token/info") {
    result.value = encoder_.encode(std::tuple{
        token.name, token.symbol, token.decimals, token.total_supply,
        token.max_supply, tessera::token::is_paused(token), token.owner,
        token.asset_info});
    return result;
  }
  if (path == "/token/balance") {
    auto account = encoder_.try_decode<account_id_t>(data);
    if (!account.has_value()) {
      return make_query_failure(std::move(result),
                                query_error_code::invalid_key,
                                "expected 32-byte account id");
    }
    result.value =
        encoder_.encode(tessera::token::balance_of(token, account.value()));
    return result;
  }
  if (path == "/token/allowance") {
    auto pair =
        encoder_.try_decode<std::tuple<account_id_t, account_id_t>>(data);
    if (!pair.has_value()) {
      return make_query_failure(std::move(result),
                                query_error_code::invalid_key,
                                "expected (owner, spender) account ids");
    }
    result.value = encoder_.encode(tessera::token::allowance(
        token, std::get<0>(pair.value()), std::get<1>(pair.value())));
    return result;
  }
  if (path == "/token/owner") {
    result.value = encoder_.encode(tessera::token::owner(token));
    return result;
  }
  if (path == "/token/asset_info") {
    result.value = encoder_.encode(tessera::token::asset_info(token));
    return result;
  }
  if (path == "/token/total_supply") {
    result.value = encoder_.encode(token.total_supply);
    return result;
  }
  if (path == "/token/max_supply") {
    result.value = encoder_.encode(token.max_supply);
    return result;
  }
  if (path == "/token/paused") {
    result.value = encoder_.encode(tessera::token::is_paused(token));
    return result;
  }
  return make_query_failure(std::move(result),
                            query_error_code::unsupported_path,
                            "unsupported token query path");
}

std::vector<history_entry_t> engine::history(const uint64_t from_height,
                                             const uint64_t to_height) const {
  auto lock = std::scoped_lock{mutex_};
  return load_history(from_height, to_height);
}

std::vector<history_entry_t> engine::load_history(
    const uint64_t from_height,
    const uint64_t to_height) const {
  auto out = std::vector<history_entry_t>{};
  if (from_height > to_height) {
    return out;
  }
  for (const auto& [row_key, value] :
       storage_.list_by_prefix(make_bytes_view(key::kHistoryPrefix))) {
    auto parsed = key::parse_history_key(row_key);
    if (!parsed.has_value()) {
      spdlog::warn("Skipping malformed history key {}", to_hex(row_key));
      continue;
    }
    if (parsed->first < from_height) {
      continue;
    }
    if (parsed->first > to_height) {
      break;
    }
    out.push_back(encoder_.decode<history_entry_t>(value));
  }
  return out;
}

hash32_t engine::chain_id() const {
  auto lock = std::scoped_lock{mutex_};
  return chain_id_;
}

void engine::set_signature_verifier(signature_verifier_t verifier) {
  auto lock = std::scoped_lock{mutex_};
  signature_verifier_ = std::move(verifier);
}

std::optional<engine::validated_transaction> engine::validate_transaction(
    const bytes_view_t& raw_tx,
    const std::string_view codespace,
    const nonce_table_t& last_nonces,
    transaction_result_t& result) const {
  if (raw_tx.empty()) {
    result = make_failure(transaction_error_code::invalid_transaction,
                          codespace, "empty transaction");
    return std::nullopt;
  }
  auto decoded = encoder_.try_decode<transaction_t>(raw_tx);
  if (!decoded.has_value()) {
    result = make_failure(transaction_error_code::invalid_transaction,
                          codespace, "transaction is not valid SCALE");
    return std::nullopt;
  }
  if (encoder_.encode(decoded.value()).size() != raw_tx.size()) {
    result = make_failure(transaction_error_code::invalid_transaction,
                          codespace, "trailing bytes after transaction");
    return std::nullopt;
  }
  auto& tx = decoded.value();

  auto caller = tessera::crypto::account_of(tx.signer);
  if (is_null_account(caller)) {
    result = make_failure(transaction_error_code::invalid_transaction,
                          codespace, "signer resolves to the null account");
    return std::nullopt;
  }
  if (tx.version != 1) {
    result = make_failure(
        transaction_error_code::unsupported_transaction_version, codespace,
        "expected version 1");
    return std::nullopt;
  }
  if (!committed_token_.has_value()) {
    result = make_failure(transaction_error_code::token_uninitialized,
                          codespace, "chain has not been initialized");
    return std::nullopt;
  }
  if (tx.chain_id != chain_id_) {
    result = make_failure(transaction_error_code::invalid_chain_id, codespace);
    return std::nullopt;
  }
  auto expected = next_nonce(last_nonces, caller);
  if (tx.nonce != expected) {
    result = make_failure(transaction_error_code::invalid_nonce, codespace,
                          "expected nonce " + std::to_string(expected));
    return std::nullopt;
  }
  if (require_strict_crypto_ && !signature_matches_signer(tx.signer,
                                                          tx.signature)) {
    result = make_failure(transaction_error_code::invalid_signature_type,
                          codespace);
    return std::nullopt;
  }
  if (signature_verifier_ &&
      !signature_verifier_(make_bytes_view(tessera::crypto::signing_bytes(tx)),
                           tx.signer, tx.signature)) {
    result = make_failure(transaction_error_code::signature_verification_failed,
                          codespace);
    return std::nullopt;
  }

  result = transaction_result_t{};
  return validated_transaction{.tx = std::move(tx), .caller = caller};
}

transaction_result_t engine::execute_operation(
    const validated_transaction& validated) {
  auto events = tessera::token::events_t{};
  auto failed = tessera::token::apply(pending_token_.value(), validated.caller,
                                      validated.tx.payload, events);
  auto name = payload_name(validated.tx.payload);
  if (failed.has_value()) {
    spdlog::debug("{} by {} rejected: {}", name, to_hex(validated.caller),
                  to_string(failed.value()));
    return make_failure(failed.value(), kFinalizeCodespace,
                        std::string{name} + " rejected");
  }

  auto result = transaction_result_t{};
  result.info = std::string{name} + " applied";
  result.events.reserve(events.size());
  for (const auto& event : events) {
    result.events.push_back(make_transaction_event(event));
  }
  return result;
}

std::vector<tessera::storage::key_value_entry_t> engine::make_state_rows(
    const std::optional<token_state_t>& token,
    const nonce_table_t& nonces) const {
  auto rows = std::vector<tessera::storage::key_value_entry_t>{};
  if (token.has_value()) {
    rows.emplace_back(key::make_token_key(),
                      encoder_.encode(make_token_record(token.value())));
    for (const auto& [account, balance] : token->balances) {
      rows.emplace_back(key::make_balance_key(account),
                        encoder_.encode(balance));
    }
    for (const auto& [pair, amount] : token->allowances) {
      rows.emplace_back(key::make_allowance_key(pair.first, pair.second),
                        encoder_.encode(amount));
    }
  }
  for (const auto& [account, nonce] : nonces) {
    rows.emplace_back(key::make_nonce_key(account), encoder_.encode(nonce));
  }
  std::sort(std::begin(rows), std::end(rows));
  return rows;
}

hash32_t engine::compute_state_root(const std::optional<token_state_t>& token,
                                    const nonce_table_t& nonces) const {
  if (!token.has_value() && nonces.empty()) {
    return make_zero_hash();
  }
  auto hasher = tessera::blake3::hasher{};
  for (const auto& [row_key, value] : make_state_rows(token, nonces)) {
    hasher.update(make_bytes_view(encoder_.encode(std::tuple{row_key, value})));
  }
  return hasher.finalize();
}

void engine::load_persisted_state() {
  spdlog::debug("Loading persisted engine state");
  auto committed = storage_.load_committed_state();
  if (!committed.has_value()) {
    return;
  }
  last_committed_height_ = committed->height;
  last_committed_state_root_ = committed->state_root;

  if (auto stored_chain_id =
          storage_.get<hash32_t>(encoder_, key::make_chain_id_key())) {
    chain_id_ = stored_chain_id.value();
  }

  if (auto record =
          storage_.get<token_record_t>(encoder_, key::make_token_key())) {
    auto token = make_token_state(record.value());
    for (const auto& [row_key, value] :
         storage_.list_by_prefix(make_bytes_view(key::kBalanceKeyPrefix))) {
      auto account = key::parse_balance_key(row_key);
      if (!account.has_value()) {
        tessera::common::critical("malformed balance key in storage");
      }
      token.balances[account.value()] = encoder_.decode<amount_t>(value);
    }
    for (const auto& [row_key, value] :
         storage_.list_by_prefix(make_bytes_view(key::kAllowanceKeyPrefix))) {
      auto pair = key::parse_allowance_key(row_key);
      if (!pair.has_value()) {
        tessera::common::critical("malformed allowance key in storage");
      }
      token.allowances[pair.value()] = encoder_.decode<amount_t>(value);
    }
    committed_token_ = std::move(token);
  }

  for (const auto& [row_key, value] :
       storage_.list_by_prefix(make_bytes_view(key::kNonceKeyPrefix))) {
    auto account = key::parse_nonce_key(row_key);
    if (!account.has_value()) {
      tessera::common::critical("malformed nonce key in storage");
    }
    committed_nonces_[account.value()] = encoder_.decode<uint64_t>(value);
  }

  auto recomputed = compute_state_root(committed_token_, committed_nonces_);
  if (recomputed != last_committed_state_root_) {
    spdlog::error("Persisted state root {} does not match recomputed {}",
                  to_hex(last_committed_state_root_), to_hex(recomputed));
    tessera::common::critical("persisted state does not match state root");
  }
}

}  // namespace tessera::execution
