// ============================================================================
// Farewell - Main Entry Point
// ============================================================================

#include "farewell/cli.hpp"

#include <cstddef>
#include <span>

int main(int argc, char* argv[]) {
    auto exit_code = farewell::cli::run(std::span<char*>(argv, static_cast<std::size_t>(argc)));
    return static_cast<int>(exit_code);
}
