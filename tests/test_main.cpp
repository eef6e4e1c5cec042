// Catch2 supplies main(); unit tests live under unit/.
#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>
