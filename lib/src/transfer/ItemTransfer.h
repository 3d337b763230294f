#pragma once

#include <optional>
#include <string>
#include <vector>

#include "MediaTypes.h"
#include "services/RawTransport.h"
#include "sync/CancellationToken.h"
#include "transfer/BatchAuthorizer.h"

namespace mediadrop {

/// Per-item transfer states. Terminal: Succeeded, FellBackToLegacy, Failed, Cancelled.
enum class ItemState : uint8_t {
    Pending,
    PrimaryAttempted,
    LegacyAttempted,
    Succeeded,
    FellBackToLegacy,
    Failed,
    Cancelled
};

const char* ItemStateToString(ItemState state);

/**
 * ItemTransfer
 *
 * Single-shot upload of one item as an explicit state machine:
 *
 *   Pending -> PrimaryAttempted -> Succeeded
 *                               -> LegacyAttempted -> FellBackToLegacy
 *                                                  -> Failed
 *                               -> Cancelled   (primary aborted by cancellation)
 *                               -> Failed      (no legacy key)
 *
 * The primary PUT uses the batch credential when one is supplied, otherwise
 * the primary key is signed individually. The legacy PUT is always signed
 * individually. Each Step() performs at most one network attempt; nothing
 * thrown by a collaborator escapes Step().
 */
class ItemTransfer {
public:
    struct Context {
        BatchAuthorizer& authorizer;
        RawTransport& transport;
        uint32_t timeout_ms;
        CancellationToken cancel;
        LogCallback log;
        bool verbose = false;
    };

    ItemTransfer(const Context& context, std::string logical_id, const MediaItem& item,
                 const KeySet& keys, std::optional<std::string> primary_credential);

    /// Advance one transition. No-op once terminal.
    void Step();

    /// Step until terminal and return the result
    TransferResult Run();

    ItemState State() const { return state_; }
    bool IsTerminal() const;
    const std::vector<ItemState>& History() const { return history_; }
    TransferResult Result() const;

private:
    TransportResult Attempt(const std::string& key, const std::optional<std::string>& credential);
    void EnterState(ItemState next);
    void Log(const std::string& message);

    const Context& context_;
    std::string logical_id_;
    const MediaItem& item_;
    const KeySet& keys_;
    std::optional<std::string> primary_credential_;

    ItemState state_ = ItemState::Pending;
    std::vector<ItemState> history_;
    TransportResult primary_result_;
    TransportResult legacy_result_;
    std::optional<ByteBuffer> payload_;
};

} // namespace mediadrop
