#include "InMemoryLedger.hpp"
#include "Amount.hpp"
#include <iostream>
#include <stdexcept>

namespace gavel {

    InMemoryLedger::InMemoryLedger(const Identity& escrowAccount, Timestamp startTime)
        : escrow(escrowAccount), clock(startTime) {
        if (escrowAccount.isNull()) {
            throw std::invalid_argument("Escrow account cannot be null");
        }
    }

    bool InMemoryLedger::transfer(const Identity& to, Quantity amount, const std::string& memo) {
        Transfer record;
        TransferHook hook;
        {
            std::lock_guard<std::mutex> lk(mtx);

            if (to.isNull() || amount == 0) {
                std::cerr << "Error: Invalid payout of " << amount << " to '" << to.toString() << "'" << std::endl;
                return false;
            }

            if (rejecting.count(to)) {
                std::cerr << "Warning: Recipient " << to.toString() << " rejected " << memo << std::endl;
                return false;
            }

            if (!move(escrow, to, amount, memo)) {
                std::cerr << "Warning: Escrow cannot cover " << memo << " of " << formatCoins(amount) << std::endl;
                return false;
            }

            record = transfers.back();
            hook = onTransfer;
        }

        // Sin el lock: el hook puede volver a entrar en la subasta
        if (hook) hook(record);

        return true;
    }

    Timestamp InMemoryLedger::now() const {
        std::lock_guard<std::mutex> lk(mtx);
        return clock;
    }

    void InMemoryLedger::fund(const Identity& account, Quantity amount) {
        std::lock_guard<std::mutex> lk(mtx);
        balances[account] += amount;
    }

    bool InMemoryLedger::deposit(const Identity& from, Quantity amount) {
        std::lock_guard<std::mutex> lk(mtx);
        if (from.isNull() || amount == 0) return false;
        return move(from, escrow, amount, "deposit");
    }

    bool InMemoryLedger::returnDeposit(const Identity& to, Quantity amount) {
        std::lock_guard<std::mutex> lk(mtx);
        if (to.isNull() || amount == 0) return false;
        return move(escrow, to, amount, "returned deposit");
    }

    Quantity InMemoryLedger::balanceOf(const Identity& account) const {
        std::lock_guard<std::mutex> lk(mtx);
        auto it = balances.find(account);
        return it == balances.end() ? 0 : it->second;
    }

    Quantity InMemoryLedger::escrowBalance() const {
        return balanceOf(escrow);
    }

    bool InMemoryLedger::setTime(Timestamp t) {
        std::lock_guard<std::mutex> lk(mtx);
        if (t < clock) return false;
        clock = t;
        return true;
    }

    void InMemoryLedger::advance(uint64_t seconds) {
        std::lock_guard<std::mutex> lk(mtx);
        clock += seconds;
    }

    void InMemoryLedger::rejectTransfersTo(const Identity& account) {
        std::lock_guard<std::mutex> lk(mtx);
        rejecting.insert(account);
    }

    void InMemoryLedger::acceptTransfersTo(const Identity& account) {
        std::lock_guard<std::mutex> lk(mtx);
        rejecting.erase(account);
    }

    void InMemoryLedger::setTransferHook(TransferHook hook) {
        std::lock_guard<std::mutex> lk(mtx);
        onTransfer = std::move(hook);
    }

    std::vector<Transfer> InMemoryLedger::getTransfers() const {
        std::lock_guard<std::mutex> lk(mtx);
        return transfers;
    }

    std::vector<Transfer> InMemoryLedger::getTransfersFor(const Identity& account) const {
        std::lock_guard<std::mutex> lk(mtx);
        std::vector<Transfer> out;
        for (const auto& t : transfers) {
            if (t.involves(account)) out.push_back(t);
        }
        return out;
    }

    Quantity InMemoryLedger::totalPaidTo(const Identity& account, const std::string& memo) const {
        std::lock_guard<std::mutex> lk(mtx);
        Quantity total = 0;
        for (const auto& t : transfers) {
            if (t.getTo() == account && t.getMemo() == memo) total += t.getAmount();
        }
        return total;
    }

    bool InMemoryLedger::move(const Identity& from, const Identity& to, Quantity amount, const std::string& memo) {
        auto it = balances.find(from);
        if (it == balances.end() || it->second < amount) return false;

        it->second -= amount;
        balances[to] += amount;
        transfers.emplace_back(from, to, amount, memo, clock);
        return true;
    }

} // namespace gavel
