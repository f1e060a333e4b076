#ifndef DPDFOBJECT_PRIVATE_HH
#define DPDFOBJECT_PRIVATE_HH

#include <deltapdf/Constants.h>
#include <deltapdf/DPDFObjGen.hh>
#include <deltapdf/DPDFObjectHandle.hh>

#include <memory>
#include <string>
#include <variant>
#include <vector>

class DPDF_Null final
{
};

class DPDF_Bool final
{
  public:
    explicit DPDF_Bool(bool val) :
        val(val)
    {
    }
    bool val;
};

class DPDF_Integer final
{
  public:
    DPDF_Integer(long long val) :
        val(val)
    {
    }
    long long val;
};

class DPDF_Real final
{
  public:
    DPDF_Real(std::string val) :
        val(std::move(val))
    {
    }
    // Store reals as strings to avoid roundoff errors.
    std::string val;
};

// DPDF_Strings may include embedded null characters.
class DPDF_String final
{
  public:
    DPDF_String(std::string val, bool hex) :
        val(std::move(val)),
        hex(hex)
    {
    }
    std::string unparse() const;

    std::string val;
    bool hex;
};

class DPDF_Name final
{
  public:
    explicit DPDF_Name(std::string name) :
        name(std::move(name))
    {
    }
    // Encode characters that may not appear literally in a name as #xx.
    static std::string normalizeName(std::string const& name);

    std::string name;
};

class DPDF_Array final
{
  public:
    DPDF_Array() = default;
    DPDF_Array(std::vector<DPDFObjectHandle> items) :
        items(std::move(items))
    {
    }
    std::vector<DPDFObjectHandle> items;
};

class DPDF_Dictionary final
{
  public:
    DPDF_Dictionary() = default;
    DPDF_Dictionary(DPDFObjectHandle::dict_items_t items) :
        items(std::move(items))
    {
    }

    DPDFObjectHandle::dict_items_t::iterator
    find(std::string const& key)
    {
        auto it = items.begin();
        for (; it != items.end(); ++it) {
            if (it->first == key) {
                break;
            }
        }
        return it;
    }

    DPDFObjectHandle::dict_items_t items;
};

class DPDF_Reference final
{
  public:
    DPDF_Reference(DPDFObjGen og) :
        og(og)
    {
    }
    DPDFObjGen og;
};

class DPDF_Stream final
{
  public:
    DPDF_Stream(DPDFObjectHandle dict, std::string data) :
        dict(std::move(dict)),
        data(std::move(data))
    {
    }
    DPDFObjectHandle dict;
    // Raw data as found in the file
    std::string data;
    // Decoded data, filled in on first use
    std::shared_ptr<std::string> decoded;
};

class DPDFObject
{
  public:
    template <typename T>
    DPDFObject(T&& value) :
        value(std::forward<T>(value))
    {
    }

    template <typename T, typename... Args>
    inline static std::shared_ptr<DPDFObject>
    create(Args&&... args)
    {
        return std::make_shared<DPDFObject>(std::forward<T>(T(std::forward<Args>(args)...)));
    }

    // Return a unique type code for the object
    dpdf_object_type_e
    getTypeCode() const
    {
        return static_cast<dpdf_object_type_e>(value.index());
    }

    template <typename T>
    T*
    as()
    {
        return std::get_if<T>(&value);
    }

    // The order of alternatives matches dpdf_object_type_e.
    typedef std::variant<
        std::monostate,
        DPDF_Null,
        DPDF_Bool,
        DPDF_Integer,
        DPDF_Real,
        DPDF_String,
        DPDF_Name,
        DPDF_Array,
        DPDF_Dictionary,
        DPDF_Reference,
        DPDF_Stream>
        Value;
    Value value;

    DPDFObjGen og{};

    DPDFObject(DPDFObject const&) = delete;
    DPDFObject& operator=(DPDFObject const&) = delete;
};

#endif // DPDFOBJECT_PRIVATE_HH
