#include "config.hpp"
#include "errors.hpp"
#include "local_oracle.hpp"
#include "payout_gateway.hpp"
#include "raffle.hpp"

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <limits>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

using namespace rf;

namespace {

void printStatus(const Raffle& raffle, const InMemoryLedger& ledger, Timestamp now) {
    auto sinceDraw =
        std::chrono::duration_cast<std::chrono::seconds>(now - raffle.getLastTimeStamp());
    std::cout << "\nRound " << raffle.getRoundNumber() << " [" << toString(raffle.getRaffleState())
              << "]\n";
    std::cout << "  Entrance fee: " << raffle.getEntranceFee().toString()
              << "  Interval: " << raffle.getInterval().count() << "s"
              << "  Since last draw: " << sinceDraw.count() << "s\n";
    std::cout << "  Pool: " << raffle.getBalance().toString()
              << "  Players: " << raffle.getNumberOfPlayers() << "\n";
    for (std::size_t i = 0; i < raffle.getNumberOfPlayers(); ++i) {
        if (auto player = raffle.getPlayer(i)) {
            std::cout << "    [" << i << "] " << *player << "\n";
        }
    }
    if (auto token = raffle.getPendingRequest()) {
        std::cout << "  Pending randomness request: " << *token << "\n";
    }
    if (auto winner = raffle.getRecentWinner()) {
        std::cout << "  Recent winner: " << *winner << " (wallet " << ledger.balanceOf(*winner).toString()
                  << ")\n";
    }
    std::cout << "  Journal root: " << raffle.getJournalRoot() << "\n";
}

void printProof(const FulfillmentProof& proof, const std::string& publicKey) {
    std::cout << "\n=== ORACLE FULFILLMENT ===\n";
    std::cout << "Token: " << proof.token << "\n";
    std::cout << "VRF public key: " << publicKey << "\n";
    std::cout << "VRF input (alpha): " << proof.alpha << "\n";
    std::cout << "VRF proof: " << proof.vrfProofHex << "\n";
    std::cout << "VRF output: " << proof.vrfOutputHex << "\n";
    for (const auto& word : proof.words) {
        std::cout << "Random word: 0x" << word.str(0, std::ios_base::hex) << "\n";
    }
    bool ok = LocalVrfOracle::verify(proof, publicKey);
    std::cout << "VRF verification: " << (ok ? "valid" : "INVALID") << "\n";
}

} // namespace

int main() {
    RaffleConfig cfg;
    try {
        cfg = loadConfigFromEnvironment();
    } catch (const std::exception& ex) {
        std::cerr << "Invalid configuration: " << ex.what() << "\n";
        return 1;
    }

    std::shared_ptr<LocalVrfOracle> oracle;
    const char* seedEnv = std::getenv("RAFFLE_ORACLE_SEED");
    try {
        oracle = seedEnv ? std::make_shared<LocalVrfOracle>(seedEnv) : std::make_shared<LocalVrfOracle>();
    } catch (const std::exception& ex) {
        std::cerr << "Unable to start local oracle: " << ex.what() << "\n";
        return 1;
    }
    auto ledger = std::make_shared<InMemoryLedger>();

    Timestamp now = std::chrono::system_clock::now();
    Raffle raffle(cfg, oracle, ledger, now, [&now]() { return now; });

    RaffleEvents events;
    events.onEnteredRound = [](const Identity& who) { std::cout << "EnteredRound(" << who << ")\n"; };
    events.onDrawRequested = [](RequestToken token) {
        std::cout << "DrawRequested(" << token << ")\n";
    };
    events.onWinnerPicked = [](const Identity& who) { std::cout << "WinnerPicked(" << who << ")\n"; };
    raffle.setEvents(events);

    std::cout << "Raffle simulator. Oracle VRF public key: " << oracle->getPublicKey() << "\n";
    std::cout << "(set RAFFLE_ENTRANCE_FEE, RAFFLE_INTERVAL_SECONDS, RAFFLE_ORACLE_SEED to override)\n";

    bool running = true;
    while (running) {
        printStatus(raffle, *ledger, now);
        std::cout << "\n[1] Enter  [2] Wait  [3] Keeper tick  [4] Oracle deliver  [5] Retry prize  [6] Abandon failed request  [0] Quit: ";
        int choice = 0;
        if (!(std::cin >> choice)) {
            break;
        }

        try {
            switch (choice) {
            case 0:
                running = false;
                break;
            case 1: {
                std::string who;
                std::string fee;
                std::cout << "Identity: ";
                std::cin >> who;
                std::cout << "Fee paid (units): ";
                std::cin >> fee;
                raffle.enter(who, Amount::parse(fee));
                break;
            }
            case 2: {
                long long seconds = 0;
                std::cout << "Seconds to advance: ";
                if (!(std::cin >> seconds) || seconds < 0) {
                    std::cin.clear();
                    std::cin.ignore(std::numeric_limits<std::streamsize>::max(), '\n');
                    std::cout << "Invalid duration.\n";
                    break;
                }
                now += std::chrono::seconds(seconds);
                break;
            }
            case 3:
                if (!raffle.checkUpkeep(now)) {
                    std::cout << "Keeper: upkeep not needed.\n";
                    break;
                }
                raffle.requestDraw(now);
                break;
            case 4: {
                auto token = raffle.getPendingRequest();
                if (!token) {
                    std::cout << "No pending request.\n";
                    break;
                }
                oracle->advanceBlocks(Raffle::getRequestConfirmations());
                auto proof = oracle->fulfill(*token, raffle);
                printProof(proof, oracle->getPublicKey());
                break;
            }
            case 5: {
                std::string who;
                std::cout << "Identity: ";
                std::cin >> who;
                bool paid = raffle.retryUnpaidPrize(who);
                std::cout << (paid ? "Prize settled.\n" : "Transfer failed again.\n");
                break;
            }
            case 6:
                raffle.abandonFailedRequest();
                break;
            default:
                std::cout << "Unknown command.\n";
                break;
            }
        } catch (const PayoutFailed& ex) {
            std::cout << "Payout failed: " << ex.what() << " (retry with [5])\n";
        } catch (const RaffleError& ex) {
            std::cout << "Rejected: " << ex.what() << "\n";
        } catch (const std::invalid_argument& ex) {
            std::cout << "Invalid input: " << ex.what() << "\n";
        } catch (const std::overflow_error& ex) {
            std::cout << "Invalid input: " << ex.what() << "\n";
        }
    }

    std::cout << "\nTotal paid out: " << ledger->totalTransferred().toString() << "\n";
    return 0;
}
