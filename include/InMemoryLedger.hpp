#pragma once
#ifndef GAVEL_IN_MEMORY_LEDGER_HPP
#define GAVEL_IN_MEMORY_LEDGER_HPP

#include "ValueLedger.hpp"
#include "Transfer.hpp"
#include <unordered_map>
#include <unordered_set>
#include <functional>
#include <mutex>
#include <vector>

namespace gavel {

    /**
     * Ledger kept in memory: named accounts, an escrow account holding the
     * auction's value, and a manual clock. Used by the CLI and the tests.
     */
    class InMemoryLedger : public ValueLedger {
    public:
        // Invoked after a successful payout has moved the balances.
        using TransferHook = std::function<void(const Transfer&)>;

        explicit InMemoryLedger(const Identity& escrowAccount, Timestamp startTime = 0);
        ~InMemoryLedger() override = default;

        // ==== ValueLedger ====
        bool transfer(const Identity& to, Quantity amount, const std::string& memo) override;
        Timestamp now() const override;

        // ==== CUENTAS ====

        /** Credits `amount` to `account` out of thin air. */
        void fund(const Identity& account, Quantity amount);

        /**
         * Moves the value accompanying a call from `from` into escrow.
         * @return false if `from` cannot cover it
         */
        bool deposit(const Identity& from, Quantity amount);

        /** Gives back a deposit whose call was rejected. */
        bool returnDeposit(const Identity& to, Quantity amount);

        Quantity balanceOf(const Identity& account) const;
        Quantity escrowBalance() const;
        const Identity& getEscrowAccount() const { return escrow; }

        // ==== RELOJ ====

        /** @return false if `t` would move the clock backwards */
        bool setTime(Timestamp t);
        void advance(uint64_t seconds);

        // ==== CONTROL DE DESTINATARIOS ====
        void rejectTransfersTo(const Identity& account);
        void acceptTransfersTo(const Identity& account);
        void setTransferHook(TransferHook hook);

        // ==== HISTORIAL ====
        std::vector<Transfer> getTransfers() const;
        std::vector<Transfer> getTransfersFor(const Identity& account) const;
        Quantity totalPaidTo(const Identity& account, const std::string& memo) const;

    private:
        bool move(const Identity& from, const Identity& to, Quantity amount, const std::string& memo);

        mutable std::mutex mtx;
        Identity escrow;
        Timestamp clock;
        std::unordered_map<Identity, Quantity> balances;
        std::unordered_set<Identity> rejecting;
        std::vector<Transfer> transfers;
        TransferHook onTransfer;
    };

} // namespace gavel

#endif // GAVEL_IN_MEMORY_LEDGER_HPP
