#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/chrono.h>
#include <pybind11/functional.h>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "rtl433/config.hpp"
#include "rtl433/coordinator.hpp"
#include "rtl433/json_export.hpp"

namespace py = pybind11;

// Helper function to convert a jsoncpp value into plain Python objects
py::object json_to_python(const Json::Value& value) {
    switch (value.type()) {
    case Json::nullValue:
        return py::none();
    case Json::booleanValue:
        return py::bool_(value.asBool());
    case Json::intValue:
        return py::int_(value.asInt64());
    case Json::uintValue:
        return py::int_(value.asUInt64());
    case Json::realValue:
        return py::float_(value.asDouble());
    case Json::stringValue:
        return py::str(value.asString());
    case Json::arrayValue: {
        py::list result;
        for (const auto& item : value) result.append(json_to_python(item));
        return result;
    }
    case Json::objectValue: {
        py::dict result;
        for (const auto& name : value.getMemberNames()) result[py::str(name)] = json_to_python(value[name]);
        return result;
    }
    }
    return py::none();
}

PYBIND11_MODULE(rtl433_ingest_py, m) {
    m.doc() = "rtl_433 supervisor and ingestion engine Python bindings";

    py::register_exception<rtl433::supervisor::SupervisorError>(m, "SupervisorError", PyExc_RuntimeError);

    // Config class
    py::class_<rtl433::IngestConfig>(m, "Config")
        .def(py::init<>())
        .def_readwrite("decoder_path", &rtl433::IngestConfig::decoder_path)
        .def_readwrite("device_id", &rtl433::IngestConfig::device_id)
        .def_readwrite("frequency", &rtl433::IngestConfig::frequency)
        .def_readwrite("gain", &rtl433::IngestConfig::gain)
        .def_readwrite("protocol_filter", &rtl433::IngestConfig::protocol_filter)
        .def_readwrite("all_protocols", &rtl433::IngestConfig::all_protocols)
        .def_readwrite("device_timeout", &rtl433::IngestConfig::device_timeout)
        .def_readwrite("sweep_interval", &rtl433::IngestConfig::sweep_interval)
        .def_readwrite("subscriber_queue_limit", &rtl433::IngestConfig::subscriber_queue_limit)
        .def_readwrite("backoff_base", &rtl433::IngestConfig::backoff_base)
        .def_readwrite("backoff_max", &rtl433::IngestConfig::backoff_max)
        .def_readwrite("max_consecutive_failures", &rtl433::IngestConfig::max_consecutive_failures)
        .def_readwrite("healthy_reset", &rtl433::IngestConfig::healthy_reset)
        .def_readwrite("start_grace", &rtl433::IngestConfig::start_grace)
        .def_readwrite("start_timeout", &rtl433::IngestConfig::start_timeout)
        .def_readwrite("stop_grace", &rtl433::IngestConfig::stop_grace)
        .def_readwrite("stall_timeout", &rtl433::IngestConfig::stall_timeout)
        .def_readwrite("log_level", &rtl433::IngestConfig::log_level)
        .def("validate", [](const rtl433::IngestConfig& self) { rtl433::validate(self); })
        .def("command", [](const rtl433::IngestConfig& self) { return rtl433::build_command(self); })
        .def("to_dict", [](const rtl433::IngestConfig& self) { return json_to_python(rtl433::config_to_json(self)); })
        .def_static("load", [](const std::string& path) { return rtl433::load_config_file(path); },
                    py::arg("path"))
        .def_static("parse", [](const std::string& text) { return rtl433::parse_config(text); },
                    py::arg("text"));

    // Subscription class
    py::class_<rtl433::Subscription>(m, "Subscription")
        .def("next", [](rtl433::Subscription& self, std::optional<double> timeout) -> py::object {
            std::optional<rtl433::ChangeEvent> event;
            {
                py::gil_scoped_release release;
                if (timeout) {
                    event = self.next_for(std::chrono::milliseconds(static_cast<long long>(*timeout * 1000.0)));
                } else {
                    event = self.next();
                }
            }
            if (!event) return py::none();
            return json_to_python(rtl433::to_json(*event));
        }, "Next change event as a dict, or None on timeout/close", py::arg("timeout") = py::none())
        .def("cancel", &rtl433::Subscription::cancel)
        .def_property_readonly("closed", &rtl433::Subscription::closed)
        .def_property_readonly("dropped", &rtl433::Subscription::dropped);

    // Coordinator class
    py::class_<rtl433::Coordinator>(m, "Coordinator")
        .def(py::init<>())
        .def("start", &rtl433::Coordinator::start, py::arg("config"), py::call_guard<py::gil_scoped_release>())
        .def("stop", &rtl433::Coordinator::stop, py::call_guard<py::gil_scoped_release>())
        .def("reconfigure", &rtl433::Coordinator::reconfigure, py::arg("config"),
             py::call_guard<py::gil_scoped_release>())
        .def("subscribe", &rtl433::Coordinator::subscribe)
        .def("devices", [](const rtl433::Coordinator& self) {
            py::list result;
            for (const auto& state : self.devices()) result.append(json_to_python(rtl433::to_json(state)));
            return result;
        })
        .def("snapshot", [](const rtl433::Coordinator& self, const std::string& identity) -> py::object {
            auto state = self.snapshot(identity);
            if (!state) return py::none();
            return json_to_python(rtl433::to_json(*state));
        }, py::arg("identity"))
        .def("stats", [](const rtl433::Coordinator& self) { return json_to_python(rtl433::to_json(self.stats())); })
        .def("last_failure", [](const rtl433::Coordinator& self) -> py::object {
            auto failure = self.last_failure();
            if (!failure) return py::none();
            return json_to_python(rtl433::to_json(*failure));
        })
        .def("set_failure_handler", [](rtl433::Coordinator& self, py::object handler) {
            if (handler.is_none()) {
                self.set_failure_handler(nullptr);
                return;
            }
            // Invoked on the supervisor thread; take the GIL for the call.
            auto shared = std::make_shared<py::function>(handler.cast<py::function>());
            self.set_failure_handler([shared](const rtl433::supervisor::FailureReport& report) {
                py::gil_scoped_acquire gil;
                try {
                    (*shared)(json_to_python(rtl433::to_json(report)));
                } catch (py::error_already_set& e) {
                    e.discard_as_unraisable("rtl433_ingest_py failure handler");
                }
            });
        }, py::arg("handler"))
        .def_property_readonly("started", &rtl433::Coordinator::started);

    // Convenience function to build the decoder command line
    m.def("build_command", &rtl433::build_command, "rtl_433 argv for a configuration", py::arg("config"));
}
