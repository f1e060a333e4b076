#include <deltapdf/DPDFLogger.hh>

#include <deltapdf/Pl_Discard.hh>
#include <deltapdf/Pl_OStream.hh>

#include <stdexcept>

DPDFLogger::Members::Members() :
    p_discard(new Pl_Discard()),
    p_stdout(new Pl_OStream("standard output", std::cout)),
    p_stderr(new Pl_OStream("standard error", std::cerr)),
    p_info(p_stdout),
    p_warn(nullptr),
    p_error(p_stderr)
{
}

DPDFLogger::Members::~Members()
{
    p_stdout->finish();
    p_stderr->finish();
}

DPDFLogger::DPDFLogger() :
    m(new Members())
{
}

std::shared_ptr<DPDFLogger>
DPDFLogger::create()
{
    return std::shared_ptr<DPDFLogger>(new DPDFLogger);
}

std::shared_ptr<DPDFLogger>
DPDFLogger::defaultLogger()
{
    static auto l = create();
    return l;
}

void
DPDFLogger::info(char const* s)
{
    getInfo(false)->writeCStr(s);
}

void
DPDFLogger::info(std::string const& s)
{
    getInfo(false)->writeString(s);
}

std::shared_ptr<Pipeline>
DPDFLogger::getInfo(bool null_okay)
{
    return throwIfNull(m->p_info, null_okay);
}

void
DPDFLogger::warn(char const* s)
{
    getWarn(false)->writeCStr(s);
}

void
DPDFLogger::warn(std::string const& s)
{
    getWarn(false)->writeString(s);
}

std::shared_ptr<Pipeline>
DPDFLogger::getWarn(bool null_okay)
{
    if (m->p_warn) {
        return m->p_warn;
    }
    return getError(null_okay);
}

void
DPDFLogger::error(char const* s)
{
    getError(false)->writeCStr(s);
}

void
DPDFLogger::error(std::string const& s)
{
    getError(false)->writeString(s);
}

std::shared_ptr<Pipeline>
DPDFLogger::getError(bool null_okay)
{
    return throwIfNull(m->p_error, null_okay);
}

std::shared_ptr<Pipeline>
DPDFLogger::standardOutput()
{
    return m->p_stdout;
}

std::shared_ptr<Pipeline>
DPDFLogger::standardError()
{
    return m->p_stderr;
}

std::shared_ptr<Pipeline>
DPDFLogger::discard()
{
    return m->p_discard;
}

void
DPDFLogger::setInfo(std::shared_ptr<Pipeline> p)
{
    m->p_info = p ? p : m->p_stdout;
}

void
DPDFLogger::setWarn(std::shared_ptr<Pipeline> p)
{
    m->p_warn = p;
}

void
DPDFLogger::setError(std::shared_ptr<Pipeline> p)
{
    m->p_error = p ? p : m->p_stderr;
}

void
DPDFLogger::setOutputStreams(std::ostream* out_stream, std::ostream* err_stream)
{
    std::shared_ptr<Pipeline> new_out;
    std::shared_ptr<Pipeline> new_err;

    if (out_stream == nullptr) {
        new_out = m->p_stdout;
    } else {
        new_out = std::make_shared<Pl_OStream>("output", *out_stream);
    }
    if (err_stream == nullptr) {
        new_err = m->p_stderr;
    } else {
        new_err = std::make_shared<Pl_OStream>("error output", *err_stream);
    }
    m->p_info = new_out;
    m->p_warn = nullptr;
    m->p_error = new_err;
}

std::shared_ptr<Pipeline>
DPDFLogger::throwIfNull(std::shared_ptr<Pipeline> p, bool null_okay)
{
    if (!(null_okay || p)) {
        throw std::logic_error("DPDFLogger: requested a null pipeline without null_okay == true");
    }
    return p;
}
