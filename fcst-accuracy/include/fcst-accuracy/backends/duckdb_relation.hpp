#pragma once

#include "fcst-accuracy/core/lazy_frame.hpp"

#include "duckdb.hpp"

#include <memory>
#include <string>
#include <vector>

namespace fcstaccuracy::backends {

using RelationPtr = duckdb::shared_ptr<duckdb::Relation>;

/**
 * @brief Lowers an expression to a DuckDB SQL expression (without alias).
 *
 * Identifiers are quoted when needed; numeric literals and undefined values
 * are typed DOUBLE.
 */
std::string toDuckDBSql(const core::Expr &expr);

/**
 * @class DuckDBRelationFrame
 * @brief ILazyFrame over a DuckDB relation.
 *
 * Operations build new relations on the same connection; nothing executes
 * until the caller runs the final relation.
 */
class DuckDBRelationFrame final : public core::ILazyFrame {
public:
	explicit DuckDBRelationFrame(RelationPtr relation);

	std::vector<std::string> columns() const override;
	std::unique_ptr<core::ILazyFrame> select(const std::vector<core::Expr> &exprs) const override;
	std::unique_ptr<core::ILazyFrame> groupBySum(const std::vector<std::string> &keys) const override;
	std::unique_ptr<core::ILazyFrame> sort(const std::vector<std::string> &keys) const override;
	std::string backendName() const override {
		return "duckdb";
	}

	const RelationPtr &relation() const {
		return relation_;
	}

private:
	RelationPtr relation_;
};

} // namespace fcstaccuracy::backends

namespace fcstaccuracy::core {

template <>
struct FrameAdapter<backends::RelationPtr> {
	/// @throws AdaptationError If the relation pointer is null.
	static std::unique_ptr<ILazyFrame> fromNative(const backends::RelationPtr &relation);
	static backends::RelationPtr toNative(const ILazyFrame &frame);
};

} // namespace fcstaccuracy::core
