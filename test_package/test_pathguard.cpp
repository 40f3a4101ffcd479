/**
 * Consumer smoke test - verify installed pathguard headers and library link
 */

#include <pathguard/pathguard.hpp>
#include <iostream>

int main() {
    std::cout << "pathguard version: " << PATHGUARD_VERSION_STRING << "\n";

    if (!pathguard::is_filename_safe("favicon-32x32.png")) {
        std::cerr << "plain filename rejected\n";
        return 1;
    }
    if (pathguard::is_filename_safe("../../etc/passwd")) {
        std::cerr << "traversal filename accepted\n";
        return 1;
    }

    auto r = pathguard::check_path("/srv/assets", "icons/../../../etc/passwd", "",
                                   pathguard::PathStyle::Posix);
    if (r.ok) {
        std::cerr << "escaping path accepted: " << r.path << "\n";
        return 1;
    }
    std::cout << "rejected: " << pathguard::path_rejection_to_string(r.rejection) << "\n";

    std::cout << "pathguard test_package: OK\n";
    return 0;
}
