#include "printer_driver.h"
#include "pdf_container.h"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>

#include <sys/wait.h>

namespace fs = std::filesystem;

// Blank Letter page used to trigger a reverse feed
static const char* REVERSE_FEED_PS =
    "%!PS-Adobe-3.0\n"
    "<< /PageSize [612 792] >> setpagedevice\n"
    "showpage\n";

std::string shell_quote(const std::string& arg) {
    std::string quoted = "'";
    for (char c : arg) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    return quoted + "'";
}

std::string reverse_feed_command(const std::string& printerName, int timeoutSeconds,
                                 const std::string& psPath) {
    std::string cmd = "timeout " + std::to_string(timeoutSeconds) + " lp";
    if (!printerName.empty()) cmd += " -d " + shell_quote(printerName);
    return cmd + " -o reverse " + shell_quote(psPath);
}

std::string parse_lp_job_id(const std::string& output) {
    const std::string marker = "request id is ";
    size_t pos = output.find(marker);
    if (pos == std::string::npos) return "";

    pos += marker.size();
    size_t end = output.find_first_of(" \t\r\n", pos);
    return output.substr(pos, end == std::string::npos ? std::string::npos : end - pos);
}

std::string manual_reverse_instructions() {
    std::ostringstream ss;
    ss << "Manual re-feed required:\n"
       << "  1. Wait until all front pages have finished printing\n"
       << "  2. Take the printed stack from the output tray without reordering it\n"
       << "  3. Put it back in the input tray printed side up, top edge first\n"
       << "  4. Print the back pages (even_pages_rotated.pdf or the second half of each batch)\n";
    return ss.str();
}

// ============================================================================
// CupsPrinterDriver
// ============================================================================

CupsPrinterDriver::CupsPrinterDriver(const std::string& printerName, int timeoutSeconds)
    : printerName_(printerName), timeoutSeconds_(timeoutSeconds) {
}

int CupsPrinterDriver::runCommand(const std::string& command, std::string& output) {
    std::string temp_out = PdfUtil::temp_path_for(
        (fs::temp_directory_path() / "lp_output.txt").string());
    std::string cmd = command + " > " + shell_quote(temp_out) + " 2>&1";

    int status = std::system(cmd.c_str());

    std::ifstream in(temp_out);
    std::stringstream buffer;
    buffer << in.rdbuf();
    output = buffer.str();
    in.close();

    std::error_code ec;
    fs::remove(temp_out, ec);

    if (status == -1) return -1;
    return WIFEXITED(status) ? WEXITSTATUS(status) : -1;
}

PrintResult CupsPrinterDriver::submit(const std::string& pdfPath) {
    PrintResult result;
    if (!fs::is_regular_file(pdfPath)) {
        result.message = "File not found: " + pdfPath;
        lastError_ = result.message;
        return result;
    }

    std::string cmd = "lp";
    if (!printerName_.empty()) cmd += " -d " + shell_quote(printerName_);
    cmd += " " + shell_quote(pdfPath);

    std::string output;
    int rc = runCommand(cmd, output);
    if (rc != 0) {
        result.message = "lp failed (exit " + std::to_string(rc) + "): " + output;
        lastError_ = result.message;
        return result;
    }

    result.submitted = true;
    result.jobId = parse_lp_job_id(output);
    result.message = result.jobId.empty() ? "Submitted" : "Submitted as " + result.jobId;
    return result;
}

bool CupsPrinterDriver::attemptReverse(int count) {
    if (count <= 0) count = 1;

    std::string temp_ps = PdfUtil::temp_path_for(
        (fs::temp_directory_path() / "reverse_feed.ps").string());
    {
        std::ofstream ps(temp_ps);
        if (!ps) {
            lastError_ = "Cannot create " + temp_ps;
            return false;
        }
        ps << REVERSE_FEED_PS;
    }

    std::cout << "INFO: Requesting reverse feed (" << count << " sheet(s) expected back)\n";
    std::string cmd = reverse_feed_command(printerName_, timeoutSeconds_, temp_ps);

    std::string output;
    int rc = runCommand(cmd, output);

    std::error_code ec;
    fs::remove(temp_ps, ec);

    if (rc != 0) {
        lastError_ = rc == 124 ? "Reverse feed timed out after " +
                                     std::to_string(timeoutSeconds_) + "s"
                               : "Reverse feed not supported (exit " + std::to_string(rc) + ")";
        return false;
    }
    return true;
}

RefeedOutcome print_fronts_for_refeed(PrinterDriver& printer, const std::string& frontsPath) {
    RefeedOutcome outcome;
    std::cout << "INFO: Printing fronts: " << frontsPath << "\n";
    outcome.print = printer.submit(frontsPath);
    if (!outcome.print.submitted) {
        std::cerr << "ERROR: " << outcome.print.message << "\n";
        return outcome;
    }
    std::cout << "INFO: " << outcome.print.message << "\n";

    // The spooler accepts unknown -o options, so a successful request does
    // not prove the printer reversed anything
    outcome.reversed = printer.attemptReverse(1);
    if (outcome.reversed) {
        std::cout << "INFO: Reverse feed requested; if the stack was not returned, re-feed it by hand\n";
    } else {
        std::cerr << "WARNING: Reverse feed not available\n";
    }
    std::cout << manual_reverse_instructions();
    return outcome;
}
