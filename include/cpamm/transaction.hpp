#ifndef CPAMM_TRANSACTION_HPP
#define CPAMM_TRANSACTION_HPP

#include <initializer_list>
#include <vector>

#include "ledger.hpp"

namespace cpamm {

// =============================================================================
// Transaction - all-or-nothing scope over journaled ledgers
//
// Checkpoints every participant on construction. Unless commit() is called,
// the destructor rolls all of them back, including when an exception leaves
// the scope.
// =============================================================================

class Transaction {
public:
    explicit Transaction(std::initializer_list<IJournaled*> participants)
        : participants_(participants) {
        for (IJournaled* p : participants_) {
            p->checkpoint();
        }
    }

    ~Transaction() {
        if (active_) rollback();
    }

    // Non-copyable
    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    void commit() {
        if (!active_) return;
        for (IJournaled* p : participants_) {
            p->commit();
        }
        active_ = false;
    }

    void rollback() {
        if (!active_) return;
        // Reverse order of checkpointing
        for (auto it = participants_.rbegin(); it != participants_.rend(); ++it) {
            (*it)->rollback();
        }
        active_ = false;
    }

    bool active() const { return active_; }

private:
    std::vector<IJournaled*> participants_;
    bool active_{true};
};

} // namespace cpamm

#endif // CPAMM_TRANSACTION_HPP
