#define DUCKDB_EXTENSION_MAIN

#include "fcst_accuracy_extension.hpp"
#include "duckdb.hpp"
#include "duckdb/common/exception.hpp"

namespace duckdb {

static void LoadInternal(ExtensionLoader &loader) {
    // Engine logging is compiled out of extension builds (DUCKDB_EXTENSION_BUILD)

    // Register Metric functions
    RegisterTsRatioMetricNativeFunction(loader);

    // Register Table Macros
    RegisterTsTableMacros(loader);
}

void FcstAccuracyExtension::Load(ExtensionLoader &loader) {
    LoadInternal(loader);
}

std::string FcstAccuracyExtension::Name() {
    return "fcst_accuracy";
}

std::string FcstAccuracyExtension::Version() const {
#ifdef EXT_VERSION_FCST_ACCURACY
    return EXT_VERSION_FCST_ACCURACY;
#else
    return "0.1.0";
#endif
}

} // namespace duckdb

extern "C" {

DUCKDB_CPP_EXTENSION_ENTRY(fcst_accuracy, loader) {
    duckdb::LoadInternal(loader);
}

}

#ifndef DUCKDB_EXTENSION_MAIN
#error DUCKDB_EXTENSION_MAIN not defined
#endif
