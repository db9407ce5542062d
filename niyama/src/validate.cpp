// niyama_validate: check context files before they are deployed
//
// Usage: niyama_validate <file.json>...
// Exit status is 1 if any file has an error, 0 otherwise (warnings allowed).

#include <niyama/validator.hpp>
#include <iostream>
#include <string>
#include <vector>

int main(int argc, char* argv[]) {
    if (argc < 2) {
        std::cerr << "Usage: " << argv[0] << " <file.json>...\n";
        return 2;
    }
    std::vector<std::string> paths(argv + 1, argv + argc);
    return niyama::check_files(paths, std::cout);
}
