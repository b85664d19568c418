#pragma once

#include <tessera/execution/signature_verifier.hpp>
#include <tessera/schema/app_info.hpp>
#include <tessera/schema/block_result.hpp>
#include <tessera/schema/commit_result.hpp>
#include <tessera/schema/encoding/scale/encoder.hpp>
#include <tessera/schema/genesis.hpp>
#include <tessera/schema/history_entry.hpp>
#include <tessera/schema/primitives.hpp>
#include <tessera/schema/query_result.hpp>
#include <tessera/schema/token_state.hpp>
#include <tessera/schema/transaction.hpp>
#include <tessera/schema/transaction_error_code.hpp>
#include <tessera/schema/transaction_result.hpp>
#include <tessera/storage/rocksdb/storage.hpp>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tessera::execution {

using encoder_t = tessera::schema::encoding::scale_encoder_t;
using storage_t =
    tessera::storage::storage<tessera::storage::rocksdb_storage_tag>;

/// Last nonce used by each account. The next accepted nonce is this plus one;
/// an account that never transacted starts at 1.
using nonce_table_t = std::map<tessera::schema::account_id_t, uint64_t>;

/// Deterministic token state machine used by the ABCI server.
///
/// The engine validates transaction envelopes, applies token operations to a
/// pending copy of the committed state while a block is being finalized, and
/// persists state, nonces and history in one batch on commit. Queries only
/// ever see committed state.
class engine final {
 public:
  /// Construct the engine and load any previously committed state.
  ///
  /// `require_strict_crypto` verifies signatures with OpenSSL and rejects
  /// named signers; when false every signature is accepted unless a verifier
  /// is installed with set_signature_verifier.
  explicit engine(encoder_t& encoder,
                  storage_t& storage,
                  bool require_strict_crypto = true);

  /// Create the token from genesis and persist it as the height 0 state.
  ///
  /// Fails with token_already_initialized when a token exists and with the
  /// token's invalid_argument codes when genesis is unusable. On success the
  /// result carries the genesis events and info() reports the new state root.
  tessera::schema::transaction_result_t init_chain(
      std::string_view chain_id,
      const tessera::schema::genesis_t& genesis);

  /// Admit a transaction for mempool inclusion (CheckTx semantics).
  ///
  /// Performs decode and envelope validation against committed nonces only;
  /// does not mutate application state.
  tessera::schema::transaction_result_t check_transaction(
      const tessera::schema::bytes_view_t& raw_tx);

  /// Validate a transaction while building or checking a proposal.
  ///
  /// Reuses the CheckTx validation pipeline.
  tessera::schema::transaction_result_t process_proposal_transaction(
      const tessera::schema::bytes_view_t& raw_tx);

  /// Execute a candidate block and compute its resulting state root.
  ///
  /// Transactions are processed in order against block-local nonces; every
  /// transaction gets a result, failures included. Calling this again before
  /// commit discards the previous candidate.
  tessera::schema::block_result_t finalize_block(
      uint64_t height,
      const std::vector<tessera::schema::bytes_t>& txs);

  /// Persist the latest finalized block atomically and make it visible to
  /// queries.
  tessera::schema::commit_result_t commit();

  /// Return application metadata (latest committed height and state root).
  tessera::schema::app_info_t info() const;

  /// Execute a read-path query against committed state.
  tessera::schema::query_result_t query(
      std::string_view path,
      const tessera::schema::bytes_view_t& data);

  /// Return committed history entries in the inclusive height range.
  std::vector<tessera::schema::history_entry_t> history(
      uint64_t from_height,
      uint64_t to_height) const;

  /// Hash of the chain id string given to init_chain; zero before it.
  tessera::schema::hash32_t chain_id() const;

  /// Install a signature verifier, replacing the one chosen by the crypto
  /// mode.
  void set_signature_verifier(signature_verifier_t verifier);

 private:
  struct validated_transaction final {
    tessera::schema::transaction_t tx;
    tessera::schema::account_id_t caller;
  };

  /// Decode and validate the transaction envelope: exact SCALE decoding, a
  /// non-null signer account, version, token presence, chain id, nonce and
  /// signature, in that order. `last_nonces` supplies the nonce sequence to
  /// check against.
  std::optional<validated_transaction> validate_transaction(
      const tessera::schema::bytes_view_t& raw_tx,
      std::string_view codespace,
      const nonce_table_t& last_nonces,
      tessera::schema::transaction_result_t& result) const;

  /// Apply a validated payload to the pending token state.
  tessera::schema::transaction_result_t execute_operation(
      const validated_transaction& validated);

  std::vector<tessera::storage::key_value_entry_t> make_state_rows(
      const std::optional<tessera::schema::token_state_t>& token,
      const nonce_table_t& nonces) const;

  tessera::schema::hash32_t compute_state_root(
      const std::optional<tessera::schema::token_state_t>& token,
      const nonce_table_t& nonces) const;

  /// Load committed checkpoint, chain id, token and nonces from storage.
  void load_persisted_state();

  std::vector<tessera::schema::history_entry_t> load_history(
      uint64_t from_height,
      uint64_t to_height) const;

  tessera::schema::query_result_t query_token(
      std::string_view path,
      const tessera::schema::bytes_view_t& data,
      tessera::schema::query_result_t result);

  mutable std::mutex mutex_;
  encoder_t& encoder_;
  storage_t& storage_;
  int64_t last_committed_height_{};
  tessera::schema::hash32_t last_committed_state_root_{};
  std::optional<tessera::schema::token_state_t> committed_token_;
  nonce_table_t committed_nonces_;
  bool has_pending_block_{false};
  int64_t pending_height_{};
  tessera::schema::hash32_t pending_state_root_{};
  std::optional<tessera::schema::token_state_t> pending_token_;
  nonce_table_t pending_nonces_;
  std::vector<tessera::schema::history_entry_t> pending_history_;
  tessera::schema::hash32_t chain_id_{};
  bool require_strict_crypto_{true};
  signature_verifier_t signature_verifier_;
};

}  // namespace tessera::execution
