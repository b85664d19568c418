#pragma once

#include <tendermint/abci/types.grpc.pb.h>
#include <tessera/execution/engine.hpp>
#include <tessera/schema/genesis.hpp>
#include <optional>

namespace tessera::abci {

/// ABCI callback listener used by CometBFT to drive the token ledger.
///
/// Quick reference (ABCI++):
/// - Echo/Flush: liveness and flush barriers.
/// - Info/InitChain: handshake; InitChain creates the token from genesis.
/// - CheckTx: mempool admission checks; no state mutation.
/// - PrepareProposal: proposer-side tx filtering under max_tx_bytes.
/// - ProcessProposal: validator-side proposal accept/reject decision.
/// - FinalizeBlock: execute block and return tx results + app_hash.
/// - Commit: persist finalized state.
/// - Snapshot methods: state sync is not offered; all offers are rejected.
/// - Vote extensions: empty extension, always accepted.
struct listener final : public tendermint::abci::ABCI::CallbackService {
  /// Bind listener to an engine. `default_genesis` is used by InitChain when
  /// the consensus host sends no app_state_bytes.
  listener(tessera::execution::engine& engine,
           std::optional<tessera::schema::genesis_t> default_genesis);

  virtual grpc::ServerUnaryReactor* Echo(
      grpc::CallbackServerContext* context,
      const tendermint::abci::RequestEcho* request,
      tendermint::abci::ResponseEcho* response) override final;

  virtual grpc::ServerUnaryReactor* Flush(
      grpc::CallbackServerContext* context,
      const tendermint::abci::RequestFlush* request,
      tendermint::abci::ResponseFlush* response) override final;

  /// Return app metadata used during node/app handshake.
  virtual grpc::ServerUnaryReactor* Info(
      grpc::CallbackServerContext* context,
      const tendermint::abci::RequestInfo* request,
      tendermint::abci::ResponseInfo* response) override final;

  /// Mempool admission check for a single tx (decode/validate only).
  virtual grpc::ServerUnaryReactor* CheckTx(
      grpc::CallbackServerContext* context,
      const tendermint::abci::RequestCheckTx* request,
      tendermint::abci::ResponseCheckTx* response) override final;

  /// Read-only query against committed state.
  virtual grpc::ServerUnaryReactor* Query(
      grpc::CallbackServerContext* context,
      const tendermint::abci::RequestQuery* request,
      tendermint::abci::ResponseQuery* response) override final;

  /// Persist finalized state after FinalizeBlock.
  virtual grpc::ServerUnaryReactor* Commit(
      grpc::CallbackServerContext* context,
      const tendermint::abci::RequestCommit* request,
      tendermint::abci::ResponseCommit* response) override final;

  /// Create the token from genesis. A node that already holds a token (a
  /// restart) answers with its committed state root.
  virtual grpc::ServerUnaryReactor* InitChain(
      grpc::CallbackServerContext* context,
      const tendermint::abci::RequestInitChain* request,
      tendermint::abci::ResponseInitChain* response) override final;

  virtual grpc::ServerUnaryReactor* ListSnapshots(
      grpc::CallbackServerContext* context,
      const tendermint::abci::RequestListSnapshots* request,
      tendermint::abci::ResponseListSnapshots* response) override final;

  virtual grpc::ServerUnaryReactor* OfferSnapshot(
      grpc::CallbackServerContext* context,
      const tendermint::abci::RequestOfferSnapshot* request,
      tendermint::abci::ResponseOfferSnapshot* response) override final;

  virtual grpc::ServerUnaryReactor* LoadSnapshotChunk(
      grpc::CallbackServerContext* context,
      const tendermint::abci::RequestLoadSnapshotChunk* request,
      tendermint::abci::ResponseLoadSnapshotChunk* response) override final;

  virtual grpc::ServerUnaryReactor* ApplySnapshotChunk(
      grpc::CallbackServerContext* context,
      const tendermint::abci::RequestApplySnapshotChunk* request,
      tendermint::abci::ResponseApplySnapshotChunk* response) override final;

  /// Proposer-side tx list preparation under max-bytes and validity checks.
  virtual grpc::ServerUnaryReactor* PrepareProposal(
      grpc::CallbackServerContext* context,
      const tendermint::abci::RequestPrepareProposal* request,
      tendermint::abci::ResponsePrepareProposal* response) override final;

  /// Validator-side proposal validation; REJECT if any tx fails validation.
  virtual grpc::ServerUnaryReactor* ProcessProposal(
      grpc::CallbackServerContext* context,
      const tendermint::abci::RequestProcessProposal* request,
      tendermint::abci::ResponseProcessProposal* response) override final;

  virtual grpc::ServerUnaryReactor* ExtendVote(
      grpc::CallbackServerContext* context,
      const tendermint::abci::RequestExtendVote* request,
      tendermint::abci::ResponseExtendVote* response) override final;

  virtual grpc::ServerUnaryReactor* VerifyVoteExtension(
      grpc::CallbackServerContext* context,
      const tendermint::abci::RequestVerifyVoteExtension* request,
      tendermint::abci::ResponseVerifyVoteExtension* response) override final;

  /// Execute ordered block transactions and return tx results + app_hash.
  virtual grpc::ServerUnaryReactor* FinalizeBlock(
      grpc::CallbackServerContext* context,
      const tendermint::abci::RequestFinalizeBlock* request,
      tendermint::abci::ResponseFinalizeBlock* response) override final;

  tessera::execution::engine& execution_engine_;
  std::optional<tessera::schema::genesis_t> default_genesis_;
};

}  // namespace tessera::abci
