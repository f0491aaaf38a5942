#include "chronicle/store/host_store.hpp"

namespace chronicle::store {

auto Transaction::begin(HostStore& store) -> std::expected<Transaction, core::error> {
    if (auto r = store.begin_transaction(); !r) return std::unexpected(r.error());
    return Transaction(store);
}

Transaction::~Transaction() {
    if (store_ == nullptr) return;
    // Unwinding from a failed step: that failure is what the caller reports.
    if (auto r = store_->rollback_transaction(); !r) {
        store_ = nullptr;
    }
}

auto Transaction::commit() -> std::expected<void, core::error> {
    if (store_ == nullptr) {
        return core::make_error(core::error_code::precondition_failed, "transaction already finished",
                                "store.transaction");
    }
    auto* store = store_;
    store_ = nullptr;
    if (auto r = store->commit_transaction(); !r) {
        if (auto rb = store->rollback_transaction(); !rb) {
            return core::rewrap(rb.error(), "commit and rollback both failed", "store.transaction");
        }
        return std::unexpected(r.error());
    }
    return {};
}

auto Transaction::rollback() -> std::expected<void, core::error> {
    if (store_ == nullptr) return {};
    auto* store = store_;
    store_ = nullptr;
    return store->rollback_transaction();
}

} // namespace chronicle::store
