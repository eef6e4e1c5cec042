#include <catch2/catch.hpp>

#include "qbo/entity.hpp"

using qbo::entity::entity_name;
using qbo::entity::snake_to_camel;

TEST_CASE("snake_to_camel", "[entity]") {
    REQUIRE(snake_to_camel("journal_entry") == "JournalEntry");
    REQUIRE(snake_to_camel("customer") == "Customer");
    REQUIRE(snake_to_camel("JournalEntry") == "JournalEntry");
    REQUIRE(snake_to_camel("") == "");
}

TEST_CASE("entity_name singularizes labels", "[entity]") {
    REQUIRE(entity_name("customers") == "Customer");
    REQUIRE(entity_name("Customer") == "Customer");
    REQUIRE(entity_name("journal_entries") == "JournalEntry");
    REQUIRE(entity_name("classes") == "Class");
    REQUIRE(entity_name("tax_codes") == "TaxCode");
    REQUIRE(entity_name("attachables") == "Attachable");
    REQUIRE(entity_name("company_info") == "CompanyInfo");
}

TEST_CASE("entity_name keeps uncountable names", "[entity]") {
    REQUIRE(entity_name("preferences") == "Preferences");
    REQUIRE(entity_name("Entitlements") == "Entitlements");
    REQUIRE(entity_name("address") == "Address");
}
