#ifdef _WIN32

#include "ado_driver.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"

#include <windows.h>
#include <objbase.h>
#include <oleauto.h>
#include <initguid.h>
#include <adoid.h>
#include <adoint.h>

#include <limits>

namespace mssql_conncheck::driver {

namespace {

const char* const AUTOMATION_EXCEPTION_TEXT = "Exception occurred.";

// Owning reference to a COM interface
template <typename T>
class ComRef {
public:
    ComRef() = default;
    ~ComRef() { reset(); }

    ComRef(const ComRef&) = delete;
    ComRef& operator=(const ComRef&) = delete;

    T* get() const noexcept { return ptr_; }
    T* operator->() const noexcept { return ptr_; }
    explicit operator bool() const noexcept { return ptr_ != nullptr; }

    // Releases the current reference, for use as an out parameter
    T** put() noexcept {
        reset();
        return &ptr_;
    }

    void reset() noexcept {
        if (ptr_) {
            ptr_->Release();
            ptr_ = nullptr;
        }
    }

private:
    T* ptr_ = nullptr;
};

// Owning BSTR
class Bstr {
public:
    Bstr() = default;
    explicit Bstr(std::string_view utf8) {
        if (utf8.empty()) {
            return;
        }
        int length = MultiByteToWideChar(CP_UTF8, 0, utf8.data(), static_cast<int>(utf8.size()), nullptr, 0);
        str_ = SysAllocStringLen(nullptr, static_cast<UINT>(length));
        if (!str_) {
            throw core::ProviderError("Out of memory allocating BSTR", static_cast<std::int32_t>(E_OUTOFMEMORY));
        }
        MultiByteToWideChar(CP_UTF8, 0, utf8.data(), static_cast<int>(utf8.size()), str_, length);
    }
    ~Bstr() { SysFreeString(str_); }

    Bstr(const Bstr&) = delete;
    Bstr& operator=(const Bstr&) = delete;

    BSTR get() const noexcept { return str_; }

    BSTR* put() noexcept {
        SysFreeString(str_);
        str_ = nullptr;
        return &str_;
    }

    std::string to_utf8() const {
        if (!str_) {
            return "";
        }
        int wide_length = static_cast<int>(SysStringLen(str_));
        int length = WideCharToMultiByte(CP_UTF8, 0, str_, wide_length, nullptr, 0, nullptr, nullptr);
        std::string result(static_cast<size_t>(length), '\0');
        WideCharToMultiByte(CP_UTF8, 0, str_, wide_length, result.data(), length, nullptr, nullptr);
        return result;
    }

private:
    BSTR str_ = nullptr;
};

// Owning VARIANT
class Variant {
public:
    Variant() { VariantInit(&value_); }
    ~Variant() { VariantClear(&value_); }

    Variant(const Variant&) = delete;
    Variant& operator=(const Variant&) = delete;

    VARIANT& get() noexcept { return value_; }

private:
    VARIANT value_;
};

VARIANT index_variant(long index) {
    VARIANT v;
    VariantInit(&v);
    v.vt = VT_I4;
    v.lVal = index;
    return v;
}

// Description of the first entry of the ADO Errors collection, empty when there is none
std::string first_provider_error(ADOConnection* conn) {
    if (!conn) {
        return "";
    }

    ComRef<ADOErrors> errors;
    long count = 0;
    if (FAILED(conn->get_Errors(errors.put())) || FAILED(errors->get_Count(&count)) || count == 0) {
        return "";
    }

    ComRef<ADOError> error;
    if (FAILED(errors->get_Item(index_variant(0), error.put()))) {
        return "";
    }

    Bstr description;
    if (FAILED(error->get_Description(description.put()))) {
        return "";
    }
    return description.to_utf8();
}

// Builds the error for a failed ADO call from the thread's COM error info
core::ProviderError make_provider_error(HRESULT hr, const std::string& context, ADOConnection* conn = nullptr) {
    std::string description;

    ComRef<IErrorInfo> info;
    if (GetErrorInfo(0, info.put()) == S_OK && info) {
        Bstr text;
        if (SUCCEEDED(info->GetDescription(text.put()))) {
            description = text.to_utf8();
        }
    }
    if (description.empty()) {
        description = first_provider_error(conn);
    }

    LOG_DEBUG(context + " failed with HRESULT " + std::to_string(static_cast<std::int32_t>(hr)));

    if (description.empty()) {
        return core::ProviderError(context + " failed", static_cast<std::int32_t>(hr));
    }
    return core::ProviderError(AUTOMATION_EXCEPTION_TEXT, static_cast<std::int32_t>(DISP_E_EXCEPTION),
                               core::ProviderErrorDetail{description, static_cast<std::int32_t>(hr)});
}

void check_hresult(HRESULT hr, const std::string& context, ADOConnection* conn = nullptr) {
    if (FAILED(hr)) {
        throw make_provider_error(hr, context, conn);
    }
}

long timeout_seconds(std::chrono::seconds timeout) {
    if (timeout.count() > std::numeric_limits<long>::max()) {
        return std::numeric_limits<long>::max();
    }
    return static_cast<long>(timeout.count());
}

class AdoCursor : public Cursor {
public:
    explicit AdoCursor(ADOConnection* conn)
        : conn_(conn) {}

    ~AdoCursor() override {
        if (is_open()) {
            HRESULT hr = recordset_->Close();
            if (FAILED(hr)) {
                LOG_WARN("Recordset Close failed in destructor");
            }
        }
    }

    void execute(std::string_view sql) override {
        LOG_TRACE("ADO Execute: " + std::string(sql));
        close();

        Bstr command(sql);
        check_hresult(conn_->Execute(command.get(), nullptr, adCmdText, recordset_.put()),
                      "Connection.Execute", conn_);
        first_fetch_ = true;
    }

    bool fetch() override {
        if (!is_open()) {
            return false;
        }

        if (!first_fetch_) {
            check_hresult(recordset_->MoveNext(), "Recordset.MoveNext", conn_);
        }
        first_fetch_ = false;

        VARIANT_BOOL at_end = VARIANT_TRUE;
        check_hresult(recordset_->get_EOF(&at_end), "Recordset.EOF", conn_);
        return at_end == VARIANT_FALSE;
    }

    std::optional<std::string> get_string(std::size_t column) override {
        if (!is_open()) {
            throw core::ProviderError("No open recordset", static_cast<std::int32_t>(E_UNEXPECTED));
        }

        ComRef<ADOFields> fields;
        check_hresult(recordset_->get_Fields(fields.put()), "Recordset.Fields", conn_);

        ComRef<ADOField> field;
        check_hresult(fields->get_Item(index_variant(static_cast<long>(column) - 1), field.put()),
                      "Fields.Item", conn_);

        Variant value;
        check_hresult(field->get_Value(&value.get()), "Field.Value", conn_);
        if (value.get().vt == VT_NULL || value.get().vt == VT_EMPTY) {
            return std::nullopt;
        }

        Variant text;
        check_hresult(VariantChangeType(&text.get(), &value.get(), 0, VT_BSTR), "VariantChangeType");

        Bstr converted;
        *converted.put() = text.get().bstrVal;
        text.get().vt = VT_EMPTY;  // ownership moved to converted
        return converted.to_utf8();
    }

    void close() override {
        if (is_open()) {
            check_hresult(recordset_->Close(), "Recordset.Close", conn_);
        }
        recordset_.reset();
    }

private:
    ADOConnection* conn_;
    ComRef<ADORecordset> recordset_;
    bool first_fetch_ = true;

    // Statements without a result set leave a closed recordset behind
    bool is_open() const {
        if (!recordset_) {
            return false;
        }
        long state = adStateClosed;
        return SUCCEEDED(recordset_->get_State(&state)) && (state & adStateOpen) != 0;
    }
};

class AdoRawConnection : public RawConnection {
public:
    AdoRawConnection() {
        check_hresult(CoCreateInstance(CLSID_CADOConnection, nullptr, CLSCTX_INPROC_SERVER,
                                       IID_IADOConnection, reinterpret_cast<void**>(conn_.put())),
                      "CoCreateInstance(ADODB.Connection)");
    }

    ~AdoRawConnection() override {
        if (open_) {
            HRESULT hr = conn_->Close();
            if (FAILED(hr)) {
                LOG_WARN("ADO Connection Close failed in destructor");
            }
        }
    }

    void open(const std::string& connection_string, const ConnectOptions& options) {
        check_hresult(conn_->put_ConnectionTimeout(timeout_seconds(options.timeout)), "Connection.ConnectionTimeout");
        check_hresult(conn_->put_CommandTimeout(timeout_seconds(options.timeout)), "Connection.CommandTimeout");

        Bstr conn_str(connection_string);
        Bstr empty;
        check_hresult(conn_->Open(conn_str.get(), empty.get(), empty.get(), adConnectUnspecified),
                      "Connection.Open", conn_.get());
        open_ = true;

        // ADO commits each statement unless a transaction is started
        if (!options.autocommit) {
            long level = 0;
            check_hresult(conn_->BeginTrans(&level), "Connection.BeginTrans", conn_.get());
        }
    }

    std::unique_ptr<Cursor> cursor() override {
        return std::make_unique<AdoCursor>(conn_.get());
    }

    void close() override {
        if (!open_) {
            return;
        }
        check_hresult(conn_->Close(), "Connection.Close", conn_.get());
        open_ = false;
    }

private:
    ComRef<ADOConnection> conn_;
    bool open_ = false;
};

} // anonymous namespace

AdoDriver::AdoDriver() {
    HRESULT hr = CoInitializeEx(nullptr, COINIT_MULTITHREADED);
    if (hr == RPC_E_CHANGED_MODE) {
        // Already initialized as an apartment thread by the host, usable as is
        LOG_DEBUG("COM already initialized with a different threading model");
        return;
    }
    check_hresult(hr, "CoInitializeEx");
    com_initialized_ = true;
}

AdoDriver::~AdoDriver() {
    if (com_initialized_) {
        CoUninitialize();
    }
}

std::unique_ptr<RawConnection> AdoDriver::connect(const std::string& connection_string,
                                                  const ConnectOptions& options) {
    auto raw = std::make_unique<AdoRawConnection>();
    raw->open(connection_string, options);

    LOG_DEBUG("ADO connection established");
    return raw;
}

} // namespace mssql_conncheck::driver

#endif // _WIN32
