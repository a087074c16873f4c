// test/test_engine_registry.cpp
#include "engine/engine_registry.hpp"
#include "car/car.hpp"
#include <iostream>
#include <sstream>
#include <stdexcept>

// ANSI color codes
#define COLOR_GREEN "\033[32m"
#define COLOR_RED "\033[31m"
#define COLOR_YELLOW "\033[33m"
#define COLOR_RESET "\033[0m"

namespace {

// Variant defined outside the library; Car must accept it unchanged
class RotaryEngine : public engine::Engine {
public:
    void start(std::ostream& out) override { out << "Rotary engine is starting...\n"; }
    void stop(std::ostream& out) override { out << "Rotary engine is stopping...\n"; }
    std::string type() const override { return "Rotary Engine"; }
    std::string key() const override { return "rotary"; }
};

} // namespace

bool test_builtin_engines() {
    std::cout << "\n" << COLOR_YELLOW << "=== Test 1: Built-in Engines ===" << COLOR_RESET << "\n";

    auto registry = engine::EngineRegistry::with_builtin_engines();
    auto keys = registry.keys();

    bool pass = registry.size() == 4 &&
                keys == std::vector<std::string>{"diesel", "electric", "hybrid", "petrol"};

    for (const auto& k : keys) {
        auto e = registry.create(k);
        std::cout << "  " << k << " -> " << e->type() << "\n";
        pass = pass && e->key() == k;
    }

    std::cout << "  Result: " << (pass ? COLOR_GREEN "PASS" : COLOR_RED "FAIL") << COLOR_RESET << "\n";
    return pass;
}

bool test_case_insensitive() {
    std::cout << "\n" << COLOR_YELLOW << "=== Test 2: Case-Insensitive Keys ===" << COLOR_RESET << "\n";

    auto registry = engine::EngineRegistry::with_builtin_engines();
    auto e = registry.create("ElEcTrIc");

    bool pass = registry.contains("PETROL") && e->type() == "Electric Engine";

    std::cout << "  create(\"ElEcTrIc\") -> " << e->type() << "\n";
    std::cout << "  Result: " << (pass ? COLOR_GREEN "PASS" : COLOR_RED "FAIL") << COLOR_RESET << "\n";
    return pass;
}

bool test_unknown_key() {
    std::cout << "\n" << COLOR_YELLOW << "=== Test 3: Unknown Key ===" << COLOR_RESET << "\n";

    auto registry = engine::EngineRegistry::with_builtin_engines();
    bool threw = false;
    std::string msg;
    try {
        registry.create("steam");
    } catch (const std::invalid_argument& e) {
        threw = true;
        msg = e.what();
    }

    bool pass = threw && msg.find("steam") != std::string::npos &&
                msg.find("petrol") != std::string::npos && !registry.contains("steam");

    std::cout << "  Message: " << msg << "\n";
    std::cout << "  Result: " << (pass ? COLOR_GREEN "PASS" : COLOR_RED "FAIL") << COLOR_RESET << "\n";
    return pass;
}

bool test_invalid_registration() {
    std::cout << "\n" << COLOR_YELLOW << "=== Test 4: Invalid Registration ===" << COLOR_RESET << "\n";

    engine::EngineRegistry registry;
    int rejected = 0;

    try {
        registry.register_engine("", [] { return std::make_unique<RotaryEngine>(); });
    } catch (const std::invalid_argument&) {
        ++rejected;
    }
    try {
        registry.register_engine("rotary", nullptr);
    } catch (const std::invalid_argument&) {
        ++rejected;
    }
    registry.register_engine("broken", [] { return std::unique_ptr<engine::Engine>(); });
    try {
        registry.create("broken");
    } catch (const std::invalid_argument&) {
        ++rejected;
    }

    bool pass = rejected == 3 && !registry.contains("rotary");

    std::cout << "  Rejected: " << rejected << "/3\n";
    std::cout << "  Result: " << (pass ? COLOR_GREEN "PASS" : COLOR_RED "FAIL") << COLOR_RESET << "\n";
    return pass;
}

bool test_custom_variant_in_car() {
    std::cout << "\n" << COLOR_YELLOW << "=== Test 5: Custom Variant Fits Car ===" << COLOR_RESET << "\n";

    auto registry = engine::EngineRegistry::with_builtin_engines();
    registry.register_engine("Rotary", [] { return std::make_unique<RotaryEngine>(); });

    std::ostringstream out;
    car::Car car(registry.create("petrol"), out);
    car.set_engine(registry.create("rotary"));
    car.start_car();

    const std::string expected =
        "Engine replaced with: Rotary Engine\n"
        "Car is starting with Rotary Engine\n"
        "Rotary engine is starting...\n";

    bool pass = registry.size() == 5 && out.str() == expected;

    std::cout << out.str();
    std::cout << "  Result: " << (pass ? COLOR_GREEN "PASS" : COLOR_RED "FAIL") << COLOR_RESET << "\n";
    return pass;
}

bool test_fresh_instances() {
    std::cout << "\n" << COLOR_YELLOW << "=== Test 6: Fresh Instance Per create() ===" << COLOR_RESET << "\n";

    auto registry = engine::EngineRegistry::with_builtin_engines();
    auto a = registry.create("hybrid");
    auto b = registry.create("hybrid");

    bool pass = a && b && a.get() != b.get();

    std::cout << "  Result: " << (pass ? COLOR_GREEN "PASS" : COLOR_RED "FAIL") << COLOR_RESET << "\n";
    return pass;
}

int main() {
    std::cout << COLOR_YELLOW << "╔════════════════════════════════════════════════════════════╗\n";
    std::cout << "║        EngineRegistry Validation Tests                     ║\n";
    std::cout << "╚════════════════════════════════════════════════════════════╝" << COLOR_RESET << "\n";

    int passed = 0;
    int total = 0;

    passed += test_builtin_engines(); total++;
    passed += test_case_insensitive(); total++;
    passed += test_unknown_key(); total++;
    passed += test_invalid_registration(); total++;
    passed += test_custom_variant_in_car(); total++;
    passed += test_fresh_instances(); total++;

    std::cout << "\n" << COLOR_YELLOW << "═══════════════════════════════════════════════════════════" << COLOR_RESET << "\n";
    std::cout << "  " << COLOR_YELLOW << "Summary: " << COLOR_RESET;

    if (passed == total) {
        std::cout << COLOR_GREEN << passed << "/" << total << " tests passed ✓" << COLOR_RESET << "\n";
    } else {
        std::cout << COLOR_RED << passed << "/" << total << " tests passed ✗" << COLOR_RESET << "\n";
    }

    std::cout << COLOR_YELLOW << "═══════════════════════════════════════════════════════════" << COLOR_RESET << "\n\n";

    return (passed == total) ? 0 : 1;
}
