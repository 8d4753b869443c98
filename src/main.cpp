#include <iostream>
#include <fstream>
#include <sstream>
#include <string>

#include "Amount.hpp"
#include "Auction.hpp"
#include "AuctionConfig.hpp"
#include "CryptoBase.hpp"
#include "EventCodec.hpp"
#include "InMemoryLedger.hpp"

using namespace std;
using namespace gavel;

namespace {

    void printUsage(const char* program) {
        cerr << "Usage: " << program << " <config-file> [script-file]" << endl;
        cerr << "Script commands:" << endl;
        cerr << "  fund <who> <amount>      credit an account" << endl;
        cerr << "  time <t> | advance <s>   move the ledger clock" << endl;
        cerr << "  bid <who> <amount>       deposit and bid" << endl;
        cerr << "  finalize                 close the auction after the deadline" << endl;
        cerr << "  claim-commission <who>   owner-only payout to the commission recipient" << endl;
        cerr << "  claim-proceeds <who>     owner-only payout to the proceeds recipient" << endl;
        cerr << "  reject <who> | accept <who>" << endl;
        cerr << "  state | history <who> | events" << endl;
        cerr << "<who> is a 40-hex address, a 64-hex public key or a label" << endl;
    }

    string describe(const Identity& id) {
        return id.isNull() ? string("-") : id.toString();
    }

    void printList(const string& label, const vector<Quantity>& values) {
        cout << "  " << label << ":";
        for (Quantity v : values) cout << " " << formatCoins(v);
        cout << endl;
    }

    bool runCommand(const string& line, Auction& auction, InMemoryLedger& ledger) {
        istringstream in(line);
        string command;
        in >> command;

        if (command == "fund" || command == "bid") {
            string who, amountText;
            Quantity amount = 0;
            if (!(in >> who >> amountText) || !parseCoins(amountText, amount)) {
                cerr << "Error: " << command << " needs <who> <amount>" << endl;
                return false;
            }
            Identity account = Identity::parse(who);

            if (command == "fund") {
                ledger.fund(account, amount);
                cout << "funded " << who << " with " << formatCoins(amount) << endl;
                return true;
            }

            if (!ledger.deposit(account, amount)) {
                cerr << "Error: " << who << " cannot cover a bid of " << formatCoins(amount) << endl;
                return false;
            }

            AuctionError result = auction.placeBid(account, amount);
            if (result != AuctionError::NONE) {
                if (!ledger.returnDeposit(account, amount)) {
                    cerr << "Error: Failed to return deposit to " << who << endl;
                }
                cout << "bid by " << who << " rejected: " << auctionErrorToString(result) << endl;
                return false;
            }

            cout << "bid by " << who << " of " << formatCoins(amount)
                 << " accepted, ends at " << auction.getAuctionEndTime() << endl;
            return true;
        }

        if (command == "time" || command == "advance") {
            uint64_t value = 0;
            if (!(in >> value)) {
                cerr << "Error: " << command << " needs a number of seconds" << endl;
                return false;
            }
            if (command == "advance") {
                ledger.advance(value);
            } else if (!ledger.setTime(value)) {
                cerr << "Error: Clock cannot move backwards to " << value << endl;
                return false;
            }
            cout << "time is " << ledger.now() << endl;
            return true;
        }

        if (command == "finalize" || command == "claim-commission" || command == "claim-proceeds") {
            AuctionError result = AuctionError::NONE;

            if (command == "finalize") {
                result = auction.finalize();
            } else {
                string who;
                if (!(in >> who)) {
                    cerr << "Error: " << command << " needs <who>" << endl;
                    return false;
                }
                Identity caller = Identity::parse(who);
                result = command == "claim-commission" ? auction.claimCommission(caller)
                                                       : auction.claimProceeds(caller);
            }

            cout << command << ": " << auctionErrorToString(result) << endl;
            return result == AuctionError::NONE;
        }

        if (command == "reject" || command == "accept") {
            string who;
            if (!(in >> who)) {
                cerr << "Error: " << command << " needs <who>" << endl;
                return false;
            }
            if (command == "reject") ledger.rejectTransfersTo(Identity::parse(who));
            else ledger.acceptTransfersTo(Identity::parse(who));
            cout << who << " now " << (command == "reject" ? "rejects" : "accepts") << " transfers" << endl;
            return true;
        }

        if (command == "state") {
            AuctionStatus status = auction.auctionState();
            cout << "ended=" << (status.ended ? "yes" : "no")
                 << " timeLeft=" << status.timeLeft
                 << " leader=" << describe(auction.getHighestBidder())
                 << " highestBid=" << formatCoins(auction.getHighestBid())
                 << " minimumBid=" << formatCoins(auction.getMinimumBid())
                 << " commission=" << formatCoins(auction.getCommissionTotal())
                 << " proceeds=" << formatCoins(auction.getOwnerProceedsPending())
                 << " escrow=" << formatCoins(ledger.escrowBalance()) << endl;
            return true;
        }

        if (command == "history") {
            string who;
            if (!(in >> who)) {
                cerr << "Error: history needs <who>" << endl;
                return false;
            }
            Identity participant = Identity::parse(who);
            cout << who << " (" << participant.toString() << ")" << endl;

            vector<Quantity> bids;
            for (const auto& bid : auction.bidHistory(participant)) bids.push_back(bid.amount);
            printList("bids", bids);
            printList("refunds", auction.refundHistory(participant));
            printList("commissions", auction.commissionHistory(participant));
            cout << "  balance: " << formatCoins(ledger.balanceOf(participant)) << endl;
            return true;
        }

        if (command == "events") {
            for (const auto& event : auction.events()) {
                cout << event.sequence << " " << eventTypeToString(event.type)
                     << " " << describe(event.subject) << " " << formatCoins(event.amount)
                     << " frame=" << CryptoBase::hexEncode(encodeEvent(event)) << endl;
            }
            cout << "chain " << (auction.verifyEvents() ? "valid" : "BROKEN") << endl;
            return true;
        }

        cerr << "Error: Unknown command '" << command << "'" << endl;
        return false;
    }

} // namespace

int main(int argc, char** argv) {
    ios::sync_with_stdio(false);

    if (argc < 2) {
        printUsage(argv[0]);
        return 1;
    }

    if (!CryptoBase::initialize()) {
        cerr << "Failed to initialize crypto (sodium)." << endl;
        return 1;
    }

    AuctionConfig config;
    if (!AuctionConfig::loadFromFile(argv[1], config)) {
        return 1;
    }

    InMemoryLedger ledger(Identity::fromLabel("gavel-escrow"), config.startTime ? *config.startTime : 0);

    try {
        Auction auction(config, ledger);

        auction.subscribe([](const AuctionEvent& event) {
            cout << "[event] " << eventTypeToString(event.type) << " "
                 << describe(event.subject) << " " << formatCoins(event.amount) << endl;
        });

        cout << "Auction open until " << auction.getAuctionEndTime()
             << " owner=" << config.owner.toString() << endl;

        ifstream scriptFile;
        if (argc > 2) {
            scriptFile.open(argv[2]);
            if (!scriptFile) {
                cerr << "Error: Cannot open script file: " << argv[2] << endl;
                return 1;
            }
        }
        istream& script = argc > 2 ? static_cast<istream&>(scriptFile) : cin;

        size_t failures = 0;
        string line;
        while (getline(script, line)) {
            const size_t comment = line.find('#');
            if (comment != string::npos) line.erase(comment);
            if (line.find_first_not_of(" \t\r") == string::npos) continue;

            if (!runCommand(line, auction, ledger)) ++failures;
        }

        if (!auction.checkInvariants()) {
            cerr << "Error: Auction invariants violated" << endl;
            return 2;
        }

        cout << "Done. " << failures << " command(s) failed." << endl;
    } catch (const InvalidConfigurationError& e) {
        cerr << e.what() << endl;
        return 1;
    } catch (const invalid_argument& e) {
        cerr << "Error: " << e.what() << endl;
        return 1;
    }

    return 0;
}
