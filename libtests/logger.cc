#include <deltapdf/assert_test.h>

#include "pdf_builder.hh"

#include <deltapdf/DPDF.hh>
#include <deltapdf/DPDFLogger.hh>
#include <deltapdf/Pl_String.hh>

#include <sstream>
#include <stdexcept>

static void
test_defaults()
{
    auto logger = DPDFLogger::defaultLogger();
    assert(logger == DPDFLogger::defaultLogger());
    assert(logger != DPDFLogger::create());

    logger->info("info to stdout\n");
    logger->warn("warn to stderr\n");
    logger->error("error to stderr\n");
    assert(logger->getInfo() == logger->standardOutput());
    assert(logger->getWarn() == logger->standardError());
    logger->setWarn(logger->discard());
    logger->warn("warning not seen\n");
    logger->setWarn(nullptr);
    logger->warn("restored warning to stderr\n");
}

static void
test_routing()
{
    auto l = DPDFLogger::create();

    // Warning follows error when error is set explicitly.
    std::string errors;
    auto pl_error = std::make_shared<Pl_String>("errors", nullptr, errors);
    l->setError(pl_error);
    l->warn("warn follows error\n");
    assert(errors == "warn follows error\n");
    l->error("error too\n");
    assert(errors == "warn follows error\nerror too\n");

    // Set warnings -- now they're separate
    std::string warnings;
    auto pl_warn = std::make_shared<Pl_String>("warnings", nullptr, warnings);
    l->setWarn(pl_warn);
    l->warn(std::string("warning now separate\n"));
    l->error(std::string("new error\n"));
    assert(warnings == "warning now separate\n");
    assert(errors == "warn follows error\nerror too\nnew error\n");

    // Restore warnings to default -- follows error again
    l->setWarn(nullptr);
    l->warn("warning 2\n");
    assert(warnings == "warning now separate\n");
    assert(errors == "warn follows error\nerror too\nnew error\nwarning 2\n");

    std::ostringstream out;
    std::ostringstream err;
    l->setOutputStreams(&out, &err);
    l->info("to out\n");
    l->warn("to err\n");
    l->error("also to err\n");
    assert(out.str() == "to out\n");
    assert(err.str() == "to err\nalso to err\n");

    // Info has its own destination and doesn't follow error
    std::string infos;
    l->setInfo(std::make_shared<Pl_String>("infos", nullptr, infos));
    l->info("progress\n");
    l->info(std::string("more progress\n"));
    l->error("last error\n");
    assert(infos == "progress\nmore progress\n");
    assert(out.str() == "to out\n");
    assert(err.str() == "to err\nalso to err\nlast error\n");

    l->setInfo(nullptr);
    l->setError(nullptr);
    assert(l->getInfo() == l->standardOutput());
    assert(l->getError() == l->standardError());
}

static void
test_document_warnings()
{
    // Extra spaces in an xref entry produce a warning
    std::string catalog = "<< /Type /Catalog /Pages << /Type /Pages /Count 0 /Kids [ ] >> >>";
    PDFBuilder b;
    b.addObject(1, catalog);
    auto xref = static_cast<dpdf_offset_t>(b.data.size());
    b.data += "xref\n0 2\n0000000000 65535 f \n0000000009  00000 n\n"
              "trailer\n<< /Size 2 /Root 1 0 R >>\n";
    b.finish(xref);

    std::string warnings;
    auto l = DPDFLogger::create();
    l->setWarn(std::make_shared<Pl_String>("warnings", nullptr, warnings));
    DPDF pdf;
    pdf.setLogger(l);
    assert(pdf.getLogger() == l);
    pdf.processMemoryFile("logged.pdf", b.data.data(), b.data.size());
    assert(pdf.anyWarnings());
    assert(warnings.find("WARNING: logged.pdf") == 0);
    assert(warnings.find("accepting invalid xref table entry") != std::string::npos);
    auto w = pdf.getWarnings();
    assert(w.size() == 1);
    assert(w.at(0).getErrorCode() == dpdf_e_corrupted);
    assert(!pdf.anyWarnings());

    // Suppressed warnings are still collected
    std::string quiet;
    l->setWarn(std::make_shared<Pl_String>("quiet", nullptr, quiet));
    DPDF pdf2;
    pdf2.setLogger(l);
    pdf2.setSuppressWarnings(true);
    pdf2.processMemoryFile("quiet.pdf", b.data.data(), b.data.size());
    assert(quiet.empty());
    assert(pdf2.getWarnings().size() == 1);

    // A null logger means the default one
    pdf2.setLogger(nullptr);
    assert(pdf2.getLogger() == DPDFLogger::defaultLogger());
}

int
main()
{
    test_defaults();
    test_routing();
    test_document_warnings();
    std::cout << "logger tests done" << '\n';
    return 0;
}
