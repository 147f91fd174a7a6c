#include <mapr/core/config/config_loader.hpp>
#include <mapr/core/mapping/mapper.hpp>

#include <any>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

using namespace mapr::common;
using namespace mapr::core;

// Domain types
struct Customer {
    int id = 0;
    std::string first_name;
    std::string last_name;
};

struct CustomerView {
    std::string display_name;
};

struct Invoice {
    int number = 0;
    long amount_cents = 0;
};

struct InvoiceLine {
    std::string text;
};

class CustomerToView : public Transformer<Customer, CustomerView> {
public:
    Result<CustomerView> transform(const Customer& customer) const override {
        return CustomerView{customer.last_name + ", " + customer.first_name};
    }
};

class InvoiceToLine : public Transformer<Invoice, InvoiceLine> {
public:
    Result<InvoiceLine> transform(const Invoice& invoice) const override {
        if (invoice.amount_cents < 0) {
            return Error(ErrorCode::TRANSFORM_FAILED,
                         "Invoice " + std::to_string(invoice.number) + " has a negative amount");
        }
        return InvoiceLine{"INV-" + std::to_string(invoice.number) + ": " +
                           std::to_string(invoice.amount_cents / 100) + " EUR"};
    }
};

// Helper class that discovery skips
struct Unrelated {};

int main() {
    std::cout << "=== mapr - Basic Mapping Example ===" << std::endl;

    // Settings are optional; defaults apply without a file
    auto loader   = config::create_config_loader();
    auto settings = loader->parse_settings("logging:\n  level: warn\n");
    if (!settings) {
        std::cerr << "Invalid settings: " << settings.error().to_string() << std::endl;
        return 1;
    }
    if (auto applied = config::apply_logging_config(settings.value().logging); !applied) {
        std::cerr << "Logging setup failed: " << applied.message() << std::endl;
        return 1;
    }

    auto built = MapperBuilder()
                     .with_config(settings.value().mapper)
                     .add_all(discover<CustomerToView, InvoiceToLine, Unrelated>())
                     .build();
    if (!built) {
        std::cerr << "Mapper setup failed: " << built.error().to_string() << std::endl;
        return 1;
    }
    auto& mapper = *built.value();

    // Explicit single
    Customer ada{1, "Ada", "Lovelace"};
    auto view = mapper.map<Customer, CustomerView>(ada);
    std::cout << "\nExplicit: " << view.value().display_name << std::endl;

    // Inferred single
    std::any erased = Customer{2, "Alan", "Turing"};
    auto inferred   = mapper.map<CustomerView>(erased);
    std::cout << "Inferred: " << inferred.value().display_name << std::endl;

    // Explicit collection with an absent element and a failing one
    std::vector<std::optional<Invoice>> invoices{Invoice{100, 12500}, std::nullopt,
                                                 Invoice{101, -300}, Invoice{102, 990}};
    auto lines = mapper.map_all<Invoice, InvoiceLine>(invoices);
    std::cout << "\nInvoices:" << std::endl;
    for (const auto& line : lines.value()) {
        if (line) {
            std::cout << "  " << line.value().text << std::endl;
        } else {
            std::cout << "  error: " << line.message() << std::endl;
        }
    }

    // Inferred collection over untyped elements
    std::vector<std::any> mixed{std::any(), std::any(Customer{3, "Grace", "Hopper"}),
                                std::any(Customer{4, "Edsger", "Dijkstra"})};
    auto views = mapper.map_all<CustomerView>(ErasedSequence::of(mixed));
    std::cout << "\nInferred collection:" << std::endl;
    if (auto all = views.value().collect()) {
        for (const auto& v : all.value()) {
            std::cout << "  " << v.display_name << std::endl;
        }
    }

    // Missing pair
    auto missing = mapper.map<Invoice, CustomerView>(Invoice{1, 1});
    std::cout << "\nMissing pair: " << missing.message() << std::endl;

    std::cout << "\n=== Example completed successfully ===" << std::endl;
    return 0;
}
