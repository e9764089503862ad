// main() для Catch2 v2; с v3 его даёт Catch2::Catch2WithMain
#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>
