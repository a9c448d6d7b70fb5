#include "parquet_writer.hpp"
#include <stdexcept>

#ifdef HAVE_ARROW
#include "../input_normalizer.hpp"
#include <arrow/api.h>
#include <arrow/io/api.h>
#include <parquet/arrow/writer.h>
#endif

namespace sipcalc {

#ifdef HAVE_ARROW

namespace {

void check(const arrow::Status& status, const std::string& what) {
    if (!status.ok()) {
        throw std::runtime_error("Failed to " + what + ": " + status.ToString());
    }
}

std::shared_ptr<arrow::Array> finish(arrow::ArrayBuilder& builder, const std::string& column) {
    std::shared_ptr<arrow::Array> array;
    check(builder.Finish(&array), "finish " + column + " array");
    return array;
}

} // anonymous namespace

size_t ParquetWriter::write_goals(const Portfolio& portfolio, const std::string& filepath) {
    if (portfolio.empty()) {
        throw std::runtime_error("Portfolio has no goals to write.");
    }

    auto schema = arrow::schema({
        arrow::field("goal_id", arrow::uint64()),
        arrow::field("goal_name", arrow::utf8()),
        arrow::field("goal_type", arrow::utf8()),
        arrow::field("priority", arrow::int32()),
        arrow::field("base_target", arrow::float64()),
        arrow::field("inflation_rate", arrow::float64()),
        arrow::field("effective_target", arrow::float64()),
        arrow::field("years", arrow::float64()),
        arrow::field("current_savings", arrow::float64()),
        arrow::field("monthly_contribution", arrow::float64()),
        arrow::field("annual_return", arrow::float64()),
        arrow::field("projected_total", arrow::float64()),
        arrow::field("coverage", arrow::float64()),
        arrow::field("health_label", arrow::utf8())
    });

    arrow::UInt64Builder id_builder;
    arrow::StringBuilder name_builder;
    arrow::StringBuilder type_builder;
    arrow::Int32Builder priority_builder;
    arrow::DoubleBuilder target_builder;
    arrow::DoubleBuilder inflation_builder;
    arrow::DoubleBuilder effective_builder;
    arrow::DoubleBuilder years_builder;
    arrow::DoubleBuilder savings_builder;
    arrow::DoubleBuilder contribution_builder;
    arrow::DoubleBuilder return_builder;
    arrow::DoubleBuilder total_builder;
    arrow::DoubleBuilder coverage_builder;
    arrow::StringBuilder label_builder;

    for (const auto& goal : portfolio.goals()) {
        NormalizedGoal g = normalize(goal.input);

        check(id_builder.Append(goal.id), "append goal_id");
        check(name_builder.Append(goal.input.name), "append goal_name");
        check(type_builder.Append(goal.input.category), "append goal_type");
        check(priority_builder.Append(g.priority), "append priority");
        check(target_builder.Append(g.target_amount), "append base_target");
        check(inflation_builder.Append(g.inflation_rate), "append inflation_rate");
        check(years_builder.Append(g.years), "append years");
        check(savings_builder.Append(g.current_savings), "append current_savings");
        check(contribution_builder.Append(g.monthly_contribution), "append monthly_contribution");
        check(return_builder.Append(g.annual_return), "append annual_return");

        if (goal.results) {
            check(effective_builder.Append(goal.results->effective_target), "append effective_target");
            check(total_builder.Append(goal.results->fv_total), "append projected_total");
            check(coverage_builder.Append(goal.results->coverage), "append coverage");
            check(label_builder.Append(goal.results->health.label), "append health_label");
        } else {
            check(effective_builder.AppendNull(), "append effective_target");
            check(total_builder.AppendNull(), "append projected_total");
            check(coverage_builder.AppendNull(), "append coverage");
            check(label_builder.AppendNull(), "append health_label");
        }
    }

    auto table = arrow::Table::Make(schema, {
        finish(id_builder, "goal_id"),
        finish(name_builder, "goal_name"),
        finish(type_builder, "goal_type"),
        finish(priority_builder, "priority"),
        finish(target_builder, "base_target"),
        finish(inflation_builder, "inflation_rate"),
        finish(effective_builder, "effective_target"),
        finish(years_builder, "years"),
        finish(savings_builder, "current_savings"),
        finish(contribution_builder, "monthly_contribution"),
        finish(return_builder, "annual_return"),
        finish(total_builder, "projected_total"),
        finish(coverage_builder, "coverage"),
        finish(label_builder, "health_label")
    });

    auto outfile_result = arrow::io::FileOutputStream::Open(filepath);
    if (!outfile_result.ok()) {
        throw std::runtime_error("Cannot open Parquet file for writing: " + filepath + " - " +
                                 outfile_result.status().ToString());
    }
    std::shared_ptr<arrow::io::FileOutputStream> outfile = *outfile_result;

    check(parquet::arrow::WriteTable(*table, arrow::default_memory_pool(), outfile, 1024),
          "write Parquet table");
    check(outfile->Close(), "close Parquet file");

    return portfolio.size();
}

#else // !HAVE_ARROW

size_t ParquetWriter::write_goals(const Portfolio& /* portfolio */, const std::string& /* filepath */) {
    throw std::runtime_error("Apache Arrow not available. Rebuild with -DHAVE_ARROW to enable Parquet support.");
}

#endif // HAVE_ARROW

} // namespace sipcalc
