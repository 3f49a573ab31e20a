// SPDX-License-Identifier: MIT
/**
 * @file volbatch_bindings.cpp
 * @brief Python bindings for the volbatch entry points using pybind11
 */

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include "src/batch/batch_runner.hpp"
#include "src/batch/batch_summary.hpp"
#include "src/batch/file_sources.hpp"
#include "src/batch/vol_batch.hpp"

namespace py = pybind11;

namespace {

volbatch::Date python_to_date(const std::string& s) {
    auto date = volbatch::Date::parse(s);
    if (!date) {
        throw py::value_error(date.error());
    }
    return *date;
}

volbatch::TickerMap python_to_ticker_map(const std::optional<std::string>& path) {
    if (!path) {
        return {};
    }
    auto map = volbatch::load_ticker_map(*path);
    if (!map) {
        throw py::value_error(map.error());
    }
    return std::move(*map);
}

volbatch::VolBatch make_vol_batch(const std::string& snapshot_dir,
                                  const std::optional<std::string>& ticker_map,
                                  const std::string& output_dir,
                                  double timeout_seconds,
                                  int skew_tenors,
                                  double interest_rate,
                                  const std::string& discount_type)
{
    volbatch::VolBatchParams params;
    params.output_dir = output_dir;
    params.interest_rate = interest_rate;
    params.discount_type = discount_type;
    params.reshape.bucket_count = skew_tenors;
    auto timeout = volbatch::milliseconds_from_seconds(timeout_seconds);
    if (!timeout) {
        throw py::value_error(volbatch::describe(timeout.error()));
    }
    params.batch.per_job_timeout = *timeout;

    return volbatch::VolBatch(
        std::move(params),
        python_to_ticker_map(ticker_map),
        std::make_shared<volbatch::JsonSnapshotSurfaceSource>(snapshot_dir),
        std::make_shared<volbatch::ConfiguredDiscountSource>());
}

}  // namespace

PYBIND11_MODULE(volbatch_py, m) {
    m.doc() = "Python bindings for volbatch skew report batch processing";

    // Returns the encoded document of the ticker (JSON text), or None when the
    // ticker failed; failures are reported in the second tuple element.
    m.def("process_single_ticker",
        [](const std::string& ticker, const std::string& start_date, bool divs, bool save,
           const std::string& snapshot_dir, const std::optional<std::string>& ticker_map,
           const std::string& output_dir, double timeout_seconds, int skew_tenors,
           double interest_rate, const std::string& discount_type) {
            auto vb = make_vol_batch(snapshot_dir, ticker_map, output_dir, timeout_seconds,
                                     skew_tenors, interest_rate, discount_type);
            auto date = python_to_date(start_date);

            volbatch::Json summary;
            {
                py::gil_scoped_release release;
                auto result = vb.process_single_ticker(ticker, date, divs, save);
                if (!result) {
                    py::gil_scoped_acquire acquire;
                    throw py::value_error(volbatch::describe(result.error()));
                }
                summary = volbatch::batch_summary_json(result->outcome);
            }

            py::object doc = py::none();
            if (vb.vol_data()) {
                doc = py::str(volbatch::dump_json(*vb.vol_data()));
            }
            return py::make_tuple(doc, py::str(volbatch::dump_json(summary)));
        },
        py::arg("ticker"), py::arg("start_date"), py::arg("divs") = false, py::arg("save") = true,
        py::arg("snapshot_dir") = ".", py::arg("ticker_map") = py::none(),
        py::arg("output_dir") = ".", py::arg("timeout_seconds") = 120.0,
        py::arg("skew_tenors") = 24, py::arg("interest_rate") = 0.05,
        py::arg("discount_type") = "smooth");

    // Processes every ticker of the map and returns the batch summary (JSON text)
    m.def("process_batch",
        [](const std::string& start_date, bool divs, bool save, const std::string& snapshot_dir,
           const std::string& ticker_map, const std::string& output_dir, double timeout_seconds,
           int skew_tenors, double interest_rate, const std::string& discount_type) {
            auto vb = make_vol_batch(snapshot_dir, ticker_map, output_dir, timeout_seconds,
                                     skew_tenors, interest_rate, discount_type);
            auto date = python_to_date(start_date);

            std::string text;
            {
                py::gil_scoped_release release;
                auto result = vb.process_batch(date, divs, save);
                if (!result) {
                    py::gil_scoped_acquire acquire;
                    throw py::value_error(volbatch::describe(result.error()));
                }
                text = volbatch::dump_json(volbatch::batch_summary_json(result->outcome));
            }
            return text;
        },
        py::arg("start_date"), py::arg("divs") = false, py::arg("save") = true,
        py::arg("snapshot_dir") = ".", py::arg("ticker_map") = "tickerMap.json",
        py::arg("output_dir") = ".", py::arg("timeout_seconds") = 120.0,
        py::arg("skew_tenors") = 24, py::arg("interest_rate") = 0.05,
        py::arg("discount_type") = "smooth");

    m.def("load_div_yields",
        [](const std::string& filename) {
            auto map = volbatch::load_ticker_map(filename);
            if (!map) {
                throw py::value_error(map.error());
            }
            return volbatch::dividend_map(*map);
        },
        py::arg("filename") = "tickerMap.json");
}
