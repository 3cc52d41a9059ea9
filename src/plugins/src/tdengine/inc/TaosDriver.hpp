#pragma once

#include <taos.h>
#if defined(_WIN32)
  #include <windows.h>
#elif defined(__linux__) || defined(__APPLE__)
  #include <dlfcn.h>
#else
  #error "Dynamic library loading is only supported on Windows, Linux, and macOS."
#endif
#include <memory>
#include <string>

#if defined(_WIN32)
  #define DYNLIB_HANDLE HMODULE
  #define DYNLIB_LOAD(lib) LoadLibraryA(lib)
  #define DYNLIB_SYM(handle, sym) GetProcAddress(handle, sym)
  #define DYNLIB_CLOSE(handle) FreeLibrary(handle)
#elif defined(__linux__) || defined(__APPLE__)
  #define DYNLIB_HANDLE void*
  #define DYNLIB_LOAD(lib) dlopen(lib, RTLD_LAZY)
  #define DYNLIB_SYM(handle, sym) dlsym(handle, sym)
  #define DYNLIB_CLOSE(handle) dlclose(handle)
#endif

// The libtaos client API, resolved at runtime so that the binary starts on
// hosts without the TDengine client installed.
class TaosDriver {
public:
    // One loaded library per driver type ("native" or "websocket"), shared by
    // every connection. Throws std::runtime_error when libtaos cannot be used.
    static std::shared_ptr<const TaosDriver> load(const std::string& driver_type);

    ~TaosDriver();

    TaosDriver(const TaosDriver&) = delete;
    TaosDriver& operator=(const TaosDriver&) = delete;

    using taos_options_func = int (*)(TSDB_OPTION, const void*, ...);
    using taos_errstr_func = const char* (*)(TAOS_RES*);
    using taos_errno_func = int (*)(TAOS_RES*);
    using taos_connect_func = TAOS* (*)(const char*, const char*, const char*, const char*, uint16_t);
    using taos_query_func = TAOS_RES* (*)(TAOS*, const char*);
    using taos_free_result_func = void (*)(TAOS_RES*);
    using taos_close_func = void (*)(TAOS*);
    using taos_fetch_row_func = TAOS_ROW (*)(TAOS_RES*);
    using taos_num_fields_func = int (*)(TAOS_RES*);
    using taos_fetch_fields_func = TAOS_FIELD* (*)(TAOS_RES*);
    using taos_fetch_lengths_func = int* (*)(TAOS_RES*);

    taos_options_func taos_options{nullptr};
    taos_errstr_func taos_errstr{nullptr};
    taos_errno_func taos_errno{nullptr};
    taos_connect_func taos_connect{nullptr};
    taos_query_func taos_query{nullptr};
    taos_free_result_func taos_free_result{nullptr};
    taos_close_func taos_close{nullptr};
    taos_fetch_row_func taos_fetch_row{nullptr};
    taos_num_fields_func taos_num_fields{nullptr};
    taos_fetch_fields_func taos_fetch_fields{nullptr};
    taos_fetch_lengths_func taos_fetch_lengths{nullptr};

private:
    explicit TaosDriver(const std::string& driver_type);

    DYNLIB_HANDLE lib_handle_{nullptr};
};
