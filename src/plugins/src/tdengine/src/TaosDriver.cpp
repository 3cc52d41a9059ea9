#include "TaosDriver.hpp"
#include "LogUtils.hpp"
#include <map>
#include <mutex>
#include <sstream>
#include <stdexcept>

namespace {

std::string last_load_error() {
    std::string error_msg = "unknown error";
#if defined(_WIN32)
    DWORD err_code = GetLastError();
    if (err_code != 0) {
        LPVOID msg_buf = nullptr;
        DWORD flags = FORMAT_MESSAGE_ALLOCATE_BUFFER | FORMAT_MESSAGE_FROM_SYSTEM | FORMAT_MESSAGE_IGNORE_INSERTS;
        DWORD lang = MAKELANGID(LANG_NEUTRAL, SUBLANG_DEFAULT);
        if (FormatMessageA(flags, nullptr, err_code, lang, (LPSTR)&msg_buf, 0, nullptr) && msg_buf) {
            error_msg = static_cast<char*>(msg_buf);
            LocalFree(msg_buf);
            auto endpos = error_msg.find_last_not_of(" \t\r\n");
            if (std::string::npos != endpos) {
                error_msg.erase(endpos + 1);
            }
        }
    }
#else
    const char* error = dlerror();
    if (error) {
        error_msg = error;
    }
#endif
    return error_msg;
}

template <typename Func>
void resolve(DYNLIB_HANDLE handle, const char* name, Func& func) {
    func = reinterpret_cast<Func>(DYNLIB_SYM(handle, name));
    if (!func) {
        throw std::runtime_error(std::string("Failed to load taos API symbol: ") + name);
    }
}

}

TaosDriver::TaosDriver(const std::string& driver_type) {
#if defined(_WIN32)
    lib_handle_ = DYNLIB_LOAD("taos.dll");
#elif defined(__APPLE__)
    lib_handle_ = DYNLIB_LOAD("libtaos.dylib");
#else
    lib_handle_ = DYNLIB_LOAD("libtaos.so");
#endif

    if (!lib_handle_) {
        throw std::runtime_error("Failed to load libtaos shared library: " + last_load_error());
    }

    try {
        resolve(lib_handle_, "taos_options", taos_options);
        resolve(lib_handle_, "taos_errstr", taos_errstr);
        resolve(lib_handle_, "taos_errno", taos_errno);
        resolve(lib_handle_, "taos_connect", taos_connect);
        resolve(lib_handle_, "taos_query", taos_query);
        resolve(lib_handle_, "taos_free_result", taos_free_result);
        resolve(lib_handle_, "taos_close", taos_close);
        resolve(lib_handle_, "taos_fetch_row", taos_fetch_row);
        resolve(lib_handle_, "taos_num_fields", taos_num_fields);
        resolve(lib_handle_, "taos_fetch_fields", taos_fetch_fields);
        resolve(lib_handle_, "taos_fetch_lengths", taos_fetch_lengths);

        int32_t code = taos_options(TSDB_OPTION_DRIVER, driver_type.c_str());
        if (code != 0) {
            std::ostringstream oss;
            oss << "Failed to set TDengine driver to " << driver_type << ": "
                << taos_errstr(nullptr) << " [0x"
                << std::hex << taos_errno(nullptr) << "]";
            throw std::runtime_error(oss.str());
        }
    } catch (const std::runtime_error&) {
        DYNLIB_CLOSE(lib_handle_);
        lib_handle_ = nullptr;
        throw;
    }

    LogUtils::debug("Loaded libtaos with {} driver", driver_type);
}

TaosDriver::~TaosDriver() {
    if (lib_handle_) {
        DYNLIB_CLOSE(lib_handle_);
        lib_handle_ = nullptr;
    }
}

std::shared_ptr<const TaosDriver> TaosDriver::load(const std::string& driver_type) {
    static std::mutex mutex;
    static std::map<std::string, std::shared_ptr<const TaosDriver>> drivers;

    std::lock_guard<std::mutex> lock(mutex);
    auto it = drivers.find(driver_type);
    if (it != drivers.end()) {
        return it->second;
    }

    std::shared_ptr<const TaosDriver> driver(new TaosDriver(driver_type));
    drivers.emplace(driver_type, driver);
    return driver;
}
