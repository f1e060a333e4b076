#ifndef DPDF_PRIVATE_HH
#define DPDF_PRIVATE_HH

#include <deltapdf/DPDF.hh>

#include <deltapdf/DPDFLogger.hh>
#include <deltapdf/DPDFTokenizer.hh>

#include <map>
#include <set>
#include <vector>

class DPDF::PatternFinder final: public InputSource::Finder
{
  public:
    PatternFinder(DPDF& dpdf, InputSource& input, bool (DPDF::*checker)(InputSource&)) :
        dpdf(dpdf),
        input(input),
        checker(checker)
    {
    }
    ~PatternFinder() final = default;
    bool
    check() final
    {
        return (this->dpdf.*checker)(input);
    }

  private:
    DPDF& dpdf;
    InputSource& input;
    bool (DPDF::*checker)(InputSource&);
};

// Marks an object as being resolved for the lifetime of the recorder. Constructing a second
// recorder for the same object means the object depends on itself.
class DPDF::ResolveRecorder final
{
  public:
    ResolveRecorder(DPDF& dpdf, DPDFObjGen og);
    ~ResolveRecorder();

  private:
    ResolveRecorder(ResolveRecorder const&) = delete;
    ResolveRecorder& operator=(ResolveRecorder const&) = delete;

    DPDF& dpdf;
    DPDFObjGen og;
};

class DPDF::Members
{
    friend class DPDF;
    friend class ResolveRecorder;

  public:
    Members();
    Members(Members const&) = delete;
    ~Members() = default;

  private:
    // A stream whose indirect /Length could not be looked up while it was parsed. The data was
    // delimited by endstream instead.
    struct DeferredLengthCheck
    {
        DPDFObjGen og;
        DPDFObjectHandle length_ref;
        size_t scanned;
        dpdf_offset_t offset;
    };

    std::shared_ptr<DPDFLogger> log;
    std::string filename;
    std::shared_ptr<std::string const> buffer;
    bool processed{false};
    bool attempt_recovery{false};
    bool suppress_warnings{false};
    std::vector<DPDFExc> warnings;
    DPDFTokenizer tokenizer;

    std::string pdf_version;
    dpdf_offset_t startxref{0};
    DPDFObjectHandle trailer;
    std::vector<DPDFObjectHandle> trailers;
    std::vector<dpdf_offset_t> xref_offsets;
    std::map<int, DPDFXRefEntry> xref_table;
    bool xref_loaded{false};
    bool reconstructed_xref{false};
    std::vector<DeferredLengthCheck> deferred_lengths;

    std::map<DPDFObjGen, DPDFObjectHandle> obj_cache;
    std::set<int> resolved_object_streams;
    std::set<DPDFObjGen> resolving;
};

#endif // DPDF_PRIVATE_HH
