// printer_reverse.cpp - Ask the printer to feed printed sheets back to the tray
//
// Standalone C++17 CLI tool for the manual duplex workflow: after the fronts
// have printed, try once to reverse-feed the stack through CUPS. Most printers
// do not support this; the tool then prints the manual re-feed steps.
//
// Usage: printer_reverse [-p <printer>] [-c <copies>] [-m]
//
//   -p, --printer <name>   - CUPS printer (default: system default)
//   -c, --copies <n>       - Number of sheets to reverse (default: 1)
//   -m, --manual           - Only show the manual instructions
//
// Exit codes:
//   0  - Reverse feed requested (or manual instructions requested)
//   1  - Reverse feed not available, manual steps shown / invalid arguments

#include <iostream>
#include <string>

#include "duplex_error.h"
#include "printer_driver.h"
#include "run_config.h"

static void print_usage(const char* prog) {
    std::cerr << "Usage:\n";
    std::cerr << "  " << prog << " [-p <printer>] [-c <copies>] [-m]\n";
    std::cerr << "\nOptions:\n";
    std::cerr << "  -p, --printer <name>   - Printer name (default: system default)\n";
    std::cerr << "  -c, --copies <n>       - Number of sheets to reverse (default: 1)\n";
    std::cerr << "  -m, --manual           - Show manual instructions only\n";
}

int main(int argc, char* argv[]) {
    std::string printer_name;
    int copies = 1;
    bool manual_only = false;

    for (int i = 1; i < argc; ++i) {
        std::string name = normalize_option(argv[i]);
        bool has_value = i + 1 < argc;
        if ((name == "p" || name == "printer") && has_value) {
            printer_name = argv[++i];
        } else if ((name == "c" || name == "copies") && has_value) {
            try {
                copies = RunConfig::parse_int(argv[i], argv[i + 1]);
            } catch (const DuplexError& e) {
                std::cerr << "ERROR: " << e.what() << "\n";
                return EC_INVALID_ARGS;
            }
            ++i;
            if (copies <= 0) {
                std::cerr << "ERROR: Copies must be > 0\n";
                return EC_INVALID_ARGS;
            }
        } else if (name == "m" || name == "manual") {
            manual_only = true;
        } else if (name == "h" || name == "help") {
            print_usage(argv[0]);
            return EC_SUCCESS;
        } else {
            std::cerr << "ERROR: Unknown or incomplete option: " << argv[i] << "\n";
            print_usage(argv[0]);
            return EC_INVALID_ARGS;
        }
    }

    if (manual_only) {
        std::cout << manual_reverse_instructions();
        return EC_SUCCESS;
    }

    std::cout << "\n";
    std::cout << "=============================================================================\n";
    std::cout << "Attempting to reverse " << copies << " printed sheet(s)\n";
    std::cout << "Printer:        " << (printer_name.empty() ? "(default)" : printer_name) << "\n";
    std::cout << "=============================================================================\n";
    std::cout << "\n";

    CupsPrinterDriver printer(printer_name);
    if (printer.attemptReverse(copies)) {
        std::cout << "INFO: Reverse command sent\n";
        return EC_SUCCESS;
    }

    std::cerr << "WARNING: " << printer.getLastError() << "\n";
    std::cout << manual_reverse_instructions();
    return 1;
}
