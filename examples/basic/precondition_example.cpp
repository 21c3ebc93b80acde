// =============================================================================
// Guard Preconditions - Example
// Version: 1.0.0
// Demonstrates: require_* guards, custom messages, override errors,
//               the Result core, GUARD_LOG_LEVEL-driven logging
// =============================================================================

#include <iostream>
#include <map>
#include <string>
#include <vector>

#include "guard/common/logging.hpp"
#include "guard/precondition/precondition.hpp"

using namespace guard;
using namespace guard::precondition;

// Sample domain type guarded on construction
class Account {
private:
    String owner_;
    Int64 balance_;

public:
    Account(const String& owner, Int64 balance)
        : owner_(owner), balance_(balance) {
        require_non_blank(owner_, "owner is required");
        require_positive(balance_);
    }

    void withdraw(Int64 amount) {
        require_range(amount, 1, balance_);
        balance_ -= amount;
    }

    [[nodiscard]] const String& owner() const { return owner_; }
    [[nodiscard]] Int64 balance() const { return balance_; }
};

class TransferDenied : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

void demo_guards() {
    std::cout << "\n=== Guard Demo ===\n";

    Account account("alice", 100);
    account.withdraw(40);
    std::cout << "Balance after withdrawal: " << account.balance() << "\n";

    try {
        account.withdraw(500);
    } catch (const IndexOutOfBoundsException& e) {
        std::cout << "Rejected: " << e.what() << "\n";
    }

    try {
        Account broken("", 10);
    } catch (const PreconditionFailedException& e) {
        std::cout << "Rejected: " << e.what() << "\n";
    }

    auto shared = std::make_shared<Account>("bob", 5);
    auto& checked = require_non_null(shared);
    std::cout << "Owner: " << checked->owner() << "\n";

    auto opened = require_non_null(std::make_unique<Account>("carol", 20), "account is required");
    std::cout << "Opened: " << opened->owner() << "\n";
}

void demo_override() {
    std::cout << "\n=== Override Error Demo ===\n";

    auto denied = std::make_exception_ptr(TransferDenied("transfer window closed"));
    try {
        require_true(false, denied);
    } catch (const TransferDenied& e) {
        std::cout << "Caller error: " << e.what() << "\n";
    }

    try {
        require_true(true, std::exception_ptr{});
    } catch (const NullArgumentException& e) {
        std::cout << "Missing override: " << e.what() << "\n";
    }
}

void demo_strings_and_containers() {
    std::cout << "\n=== Strings and Containers Demo ===\n";

    require_start_with("GRD-1042", "GRD-");
    require_start_with("GRD-1042", "1042", 4);
    require_end_with("report.csv", ".csv");

    std::vector<String> queue;
    try {
        require_non_empty(queue);
    } catch (const EmptyContainerException& e) {
        std::cout << "Rejected: " << e.what() << "\n";
    }

    std::map<String, int> routes{{"north", 1}};
    require_non_empty(routes);
    std::cout << "Routes available: " << routes.size() << "\n";

    const char* regions[] = {"eu", "us"};
    require_non_empty(regions, "no regions configured");
}

void demo_result_core() {
    std::cout << "\n=== Result Core Demo ===\n";

    auto validate = [](StringView code, int quantity) -> Result<void> {
        GUARD_TRY_VOID(check_start_with(code, "SKU"));
        GUARD_TRY_VOID(check_range(quantity, 1, 99));
        return make_success();
    };

    for (auto [code, quantity] : {std::pair<StringView, int>{"SKU-1", 3},
                                  std::pair<StringView, int>{"ABC-2", 3},
                                  std::pair<StringView, int>{"SKU-3", 120}}) {
        auto outcome = validate(code, quantity);
        if (outcome) {
            std::cout << code << " x" << quantity << ": ok\n";
        } else {
            std::cout << code << " x" << quantity << ": "
                      << error_code_name(outcome.error().code) << " "
                      << outcome.error().message << "\n";
        }
    }
}

int main() {
    std::cout << R"(
================================================================================
                     Guard Preconditions v1.0.0
                          Usage Demonstration
================================================================================
)";

    // Set GUARD_LOG_LEVEL=debug to see each rejected guard logged.
    auto& logs = logging::LogManager::instance();
    std::cout << "Log level: " << logging::to_string(logs.level()) << "\n";

    demo_guards();
    demo_override();
    demo_strings_and_containers();
    demo_result_core();

    logs.flush();
    std::cout << "\n=== Demo Complete ===\n";
    return 0;
}
