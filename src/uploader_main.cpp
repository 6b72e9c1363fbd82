/*
 * confrun-upload - send a conformance test program to a confrun daemon
 *
 * Usage: confrun-upload <http_path> <filepath>
 */

#include "uploader.h"
#include <iostream>
#include <string>

int main(int argc, char* argv[]) {
    if (argc != 3 || std::string(argv[1]) == "--help" || std::string(argv[1]) == "-h") {
        std::cerr << "Usage: " << argv[0] << " <http_path> <filepath>" << std::endl;
        std::cerr << "  http_path  The HTTP path to send the request to "
                  << "(e.g. http://localhost:5000/run)" << std::endl;
        std::cerr << "  filepath   Path to the file to send" << std::endl;
        return 2;
    }

    return confrun::send_program(argv[1], argv[2], std::cout, std::cerr);
}
