#include "cli/cli.hpp"
#include "core/utils.hpp"

#include <format>
#include <iostream>
#include <string_view>
#include <vector>

using namespace brdocs;

int main(int argc, char* argv[]) {
    try {
        const std::vector<std::string_view> args(argv + 1, argv + argc);
        return cli::run(args, std::cout, std::cerr);
    } catch (const std::exception& e) {
        utils::log::error(std::format("Fatal: {}", e.what()));
        return cli::kExitInvalid;
    }
}
