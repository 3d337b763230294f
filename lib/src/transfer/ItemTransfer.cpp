#include "ItemTransfer.h"

namespace mediadrop {

const char* ItemStateToString(ItemState state) {
    switch (state) {
        case ItemState::Pending:          return "Pending";
        case ItemState::PrimaryAttempted: return "PrimaryAttempted";
        case ItemState::LegacyAttempted:  return "LegacyAttempted";
        case ItemState::Succeeded:        return "Succeeded";
        case ItemState::FellBackToLegacy: return "FellBackToLegacy";
        case ItemState::Failed:           return "Failed";
        case ItemState::Cancelled:        return "Cancelled";
    }
    return "Unknown";
}

ItemTransfer::ItemTransfer(const Context& context, std::string logical_id, const MediaItem& item,
                           const KeySet& keys, std::optional<std::string> primary_credential)
    : context_(context),
      logical_id_(std::move(logical_id)),
      item_(item),
      keys_(keys),
      primary_credential_(std::move(primary_credential)) {
    history_.push_back(state_);
}

bool ItemTransfer::IsTerminal() const {
    return state_ == ItemState::Succeeded ||
           state_ == ItemState::FellBackToLegacy ||
           state_ == ItemState::Failed ||
           state_ == ItemState::Cancelled;
}

void ItemTransfer::EnterState(ItemState next) {
    state_ = next;
    history_.push_back(next);
}

void ItemTransfer::Step() {
    switch (state_) {
        case ItemState::Pending:
            primary_result_ = Attempt(keys_.primary_key, primary_credential_);
            EnterState(ItemState::PrimaryAttempted);
            break;

        case ItemState::PrimaryAttempted:
            if (primary_result_.ok) {
                EnterState(ItemState::Succeeded);
            } else if (primary_result_.cancelled) {
                EnterState(ItemState::Cancelled);
            } else if (keys_.legacy_key.empty()) {
                Log("Primary PUT failed for " + keys_.primary_key + " (" + primary_result_.Describe() +
                    "), no legacy key");
                EnterState(ItemState::Failed);
            } else {
                Log("Primary PUT failed for " + keys_.primary_key + " (" + primary_result_.Describe() +
                    "), trying legacy key");
                legacy_result_ = Attempt(keys_.legacy_key, std::nullopt);
                EnterState(ItemState::LegacyAttempted);
            }
            break;

        case ItemState::LegacyAttempted:
            if (legacy_result_.ok) {
                EnterState(ItemState::FellBackToLegacy);
            } else if (legacy_result_.cancelled) {
                EnterState(ItemState::Cancelled);
            } else {
                Log("Legacy PUT failed for " + keys_.legacy_key + " (" + legacy_result_.Describe() + ")");
                EnterState(ItemState::Failed);
            }
            break;

        default:
            break;
    }
}

TransferResult ItemTransfer::Run() {
    while (!IsTerminal()) {
        Step();
    }
    return Result();
}

TransportResult ItemTransfer::Attempt(const std::string& key,
                                      const std::optional<std::string>& credential) {
    TransportResult result;

    if (context_.cancel.IsCancelled()) {
        result.cancelled = true;
        result.error = "cancelled before start";
        return result;
    }

    std::string url;
    if (credential) {
        url = *credential;
    } else {
        try {
            url = context_.authorizer.AuthorizeOne(key, keys_.content_type);
        } catch (const std::exception& e) {
            result.error = std::string("authorization failed: ") + e.what();
            return result;
        }
    }

    if (!payload_) {
        if (!item_.source) {
            result.error = "item has no source";
            return result;
        }
        try {
            payload_ = item_.source->ReadAll();
        } catch (const std::exception& e) {
            result.error = std::string("read failed: ") + e.what();
            return result;
        }
    }

    TransferOptions options;
    options.timeout_ms = context_.timeout_ms;
    options.cancel = context_.cancel;

    try {
        result = context_.transport.Put(url, *payload_, keys_.content_type, options);
    } catch (const std::exception& e) {
        result = TransportResult();
        result.error = e.what();
    }

    if (!result.ok && context_.cancel.IsCancelled()) {
        result.cancelled = true;
    }

    if (context_.verbose && result.ok) {
        Log("PUT " + key + " (" + std::to_string(payload_->size()) + " bytes) " + result.Describe());
    }
    return result;
}

TransferResult ItemTransfer::Result() const {
    TransferResult result;
    result.logical_id = logical_id_;
    result.key = keys_.primary_key;

    switch (state_) {
        case ItemState::Succeeded:
            result.outcome = TransferOutcome::Succeeded;
            break;
        case ItemState::FellBackToLegacy:
            result.outcome = TransferOutcome::FellBackToLegacy;
            result.key = keys_.legacy_key;
            result.error_detail = "primary: " + primary_result_.Describe();
            break;
        case ItemState::Failed:
            result.outcome = TransferOutcome::Failed;
            result.error_detail = "primary: " + primary_result_.Describe();
            if (history_.size() > 2 && history_[2] == ItemState::LegacyAttempted) {
                result.key = keys_.legacy_key;
                result.error_detail += "; legacy: " + legacy_result_.Describe();
            }
            break;
        case ItemState::Cancelled:
            result.outcome = TransferOutcome::Cancelled;
            result.error_detail = "cancelled";
            break;
        default:
            result.outcome = TransferOutcome::NotStarted;
            break;
    }
    return result;
}

void ItemTransfer::Log(const std::string& message) {
    if (context_.log) {
        context_.log("[ItemTransfer] " + logical_id_ + ": " + message);
    }
}

} // namespace mediadrop
