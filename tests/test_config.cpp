#include "amount.hpp"
#include "config.hpp"

#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

[[noreturn]] void fail(const std::string& msg) {
    std::cerr << "config_test failure: " << msg << std::endl;
    std::exit(1);
}

using namespace rf;

const char* kVariables[] = {
    "RAFFLE_ENTRANCE_FEE",     "RAFFLE_INTERVAL_SECONDS",   "RAFFLE_KEY_HASH",
    "RAFFLE_SUBSCRIPTION_ID",  "RAFFLE_CALLBACK_GAS_LIMIT",
};

void clearEnvironment() {
    for (const char* name : kVariables) {
        unsetenv(name);
    }
}

template <typename Fn>
bool rejects(Fn&& fn) {
    try {
        fn();
    } catch (const std::invalid_argument&) {
        return true;
    }
    return false;
}

void amountsParseAndPrint() {
    if (Amount::parse("0.01").micros() != 10'000 || Amount::parse("12").micros() != 12'000'000 ||
        Amount::parse(".5").micros() != 500'000 || Amount::parse("3.000001").micros() != 3'000'001) {
        fail("decimal amounts parsed incorrectly");
    }
    if (Amount::parse("0.01").toString() != "0.01" || Amount::fromUnits(6).toString() != "6" ||
        Amount::fromMicros(60'000).toString() != "0.06") {
        fail("amounts printed incorrectly");
    }
    for (const char* bad : { "", ".", "1.", "abc", "-1", "1.2345678", "1,5" }) {
        if (!rejects([bad] { Amount::parse(bad); })) {
            fail(std::string("accepted malformed amount \"") + bad + "\"");
        }
    }

    bool underflow = false;
    try {
        Amount::fromMicros(1) - Amount::fromMicros(2);
    } catch (const std::underflow_error&) {
        underflow = true;
    }
    if (!underflow) {
        fail("negative amount was produced");
    }
    if (Amount::fromMicros(10'000) * 6 != Amount::parse("0.06")) {
        fail("amount multiplication is wrong");
    }
}

void defaultsWithoutEnvironment() {
    clearEnvironment();
    RaffleConfig cfg = loadConfigFromEnvironment();
    if (cfg.entranceFee != Amount::parse("0.01") || cfg.interval.count() != 30 ||
        cfg.oracle.keyHash.empty() || cfg.oracle.callbackGasLimit != 500'000) {
        fail("defaults changed");
    }
    if (OracleConfig::kRequestConfirmations != 3 || OracleConfig::kNumWords != 1) {
        fail("oracle constants changed");
    }
}

void environmentOverridesDefaults() {
    clearEnvironment();
    setenv("RAFFLE_ENTRANCE_FEE", " 0.25 ", 1);
    setenv("RAFFLE_INTERVAL_SECONDS", "60", 1);
    setenv("RAFFLE_KEY_HASH", "lane-500gwei", 1);
    setenv("RAFFLE_SUBSCRIPTION_ID", "7", 1);
    setenv("RAFFLE_CALLBACK_GAS_LIMIT", "750000", 1);

    RaffleConfig cfg = loadConfigFromEnvironment();
    if (cfg.entranceFee != Amount::parse("0.25") || cfg.interval.count() != 60 ||
        cfg.oracle.keyHash != "lane-500gwei" || cfg.oracle.subscriptionId != 7 ||
        cfg.oracle.callbackGasLimit != 750'000) {
        fail("environment values not applied");
    }
    clearEnvironment();
}

void invalidEnvironmentIsRejected() {
    struct Case {
        const char* name;
        const char* value;
    };
    const Case cases[] = {
        { "RAFFLE_ENTRANCE_FEE", "lots" },       { "RAFFLE_INTERVAL_SECONDS", "-5" },
        { "RAFFLE_INTERVAL_SECONDS", "soon" },   { "RAFFLE_SUBSCRIPTION_ID", "1e3" },
        { "RAFFLE_CALLBACK_GAS_LIMIT", "0" },    { "RAFFLE_CALLBACK_GAS_LIMIT", "9000000" },
        { "RAFFLE_KEY_HASH", "   " },
    };
    for (const auto& c : cases) {
        clearEnvironment();
        setenv(c.name, c.value, 1);
        if (!rejects([] { loadConfigFromEnvironment(); })) {
            fail(std::string("accepted ") + c.name + "=" + c.value);
        }
    }
    clearEnvironment();
}

} // namespace

int main() {
    amountsParseAndPrint();
    defaultsWithoutEnvironment();
    environmentOverridesDefaults();
    invalidEnvironmentIsRejected();

    std::cout << "config_test passed" << std::endl;
    return 0;
}
