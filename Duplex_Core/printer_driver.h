// Print-queue submission for the two-pass manual duplex workflow.

#ifndef PRINTER_DRIVER_H
#define PRINTER_DRIVER_H

#include <string>

struct PrintResult {
    bool submitted = false;
    std::string jobId;     // queue job id when the spooler reported one
    std::string message;
};

class PrinterDriver {
public:
    virtual ~PrinterDriver() {}

    // Queue a document for printing; does not wait for the job to finish
    virtual PrintResult submit(const std::string& pdfPath) = 0;

    // One best-effort reverse-feed request; count is the number of sheets the
    // caller expects back and does not change what is sent to the printer.
    // Returns false when the request was refused or timed out.
    virtual bool attemptReverse(int count) = 0;
};

// CUPS adapter built on the lp command
class CupsPrinterDriver : public PrinterDriver {
public:
    // Empty printerName uses the system default printer
    explicit CupsPrinterDriver(const std::string& printerName = "", int timeoutSeconds = 5);

    PrintResult submit(const std::string& pdfPath) override;
    bool attemptReverse(int count) override;

    const std::string& getPrinterName() const { return printerName_; }
    const std::string& getLastError() const { return lastError_; }

private:
    // Run command with stdout/stderr captured; returns the exit status
    int runCommand(const std::string& command, std::string& output);

    std::string printerName_;
    int timeoutSeconds_;
    std::string lastError_;
};

struct RefeedOutcome {
    PrintResult print;
    bool reversed = false;   // printer accepted the reverse-feed request
};

// Submit the fronts, then make a single reverse-feed request. The manual
// re-feed steps are always printed once the fronts are queued.
RefeedOutcome print_fronts_for_refeed(PrinterDriver& printer, const std::string& frontsPath);

// "timeout N lp [-d printer] -o reverse file": one copy of a one-page job
std::string reverse_feed_command(const std::string& printerName, int timeoutSeconds,
                                 const std::string& psPath);

// Job id from lp output ("request id is HP_LaserJet-42 (1 file(s))")
std::string parse_lp_job_id(const std::string& output);

// Single-quote an argument for /bin/sh
std::string shell_quote(const std::string& arg);

// Steps for turning the printed stack over by hand
std::string manual_reverse_instructions();

#endif // PRINTER_DRIVER_H
