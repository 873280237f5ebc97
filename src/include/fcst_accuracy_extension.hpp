#pragma once

#include "duckdb.hpp"

namespace duckdb {

// Forward declarations for function registration
void RegisterTsRatioMetricNativeFunction(ExtensionLoader &loader);

// Table macros
void RegisterTsTableMacros(ExtensionLoader &loader);

// Extension class
class FcstAccuracyExtension : public Extension {
public:
    void Load(ExtensionLoader &loader) override;
    std::string Name() override;
    std::string Version() const override;
};

} // namespace duckdb
