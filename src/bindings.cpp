#include "adapt/calibrator.hpp"
#include "adapt/response_model.hpp"
#include "adapt/session_engine.hpp"
#include "adapt/simulation.hpp"

#include "json_bridge.hpp"

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <cstdint>
#include <memory>

namespace py = pybind11;

namespace {

nlohmann::json py_to_json(py::handle handle) {
  if (handle.is_none()) {
    return nullptr;
  }
  if (py::isinstance<py::bool_>(handle)) {
    return handle.cast<bool>();
  }
  if (py::isinstance<py::int_>(handle)) {
    return static_cast<long long>(handle.cast<long long>());
  }
  if (py::isinstance<py::float_>(handle)) {
    return handle.cast<double>();
  }
  if (py::isinstance<py::str>(handle)) {
    return handle.cast<std::string>();
  }
  if (py::isinstance<py::dict>(handle)) {
    nlohmann::json json_obj = nlohmann::json::object();
    for (auto item : handle.cast<py::dict>()) {
      auto key = py::cast<std::string>(item.first);
      json_obj[key] = py_to_json(item.second);
    }
    return json_obj;
  }
  if (py::isinstance<py::list>(handle) || py::isinstance<py::tuple>(handle)) {
    nlohmann::json json_array = nlohmann::json::array();
    for (auto item : handle.cast<py::sequence>()) {
      json_array.push_back(py_to_json(item));
    }
    return json_array;
  }
  throw std::runtime_error("Unsupported Python type for JSON conversion");
}

py::object json_to_py(const nlohmann::json& json_value) {
  if (json_value.is_null()) {
    return py::none();
  }
  if (json_value.is_boolean()) {
    return py::bool_(json_value.get<bool>());
  }
  if (json_value.is_number_integer()) {
    return py::int_(json_value.get<long long>());
  }
  if (json_value.is_number_float()) {
    return py::float_(json_value.get<double>());
  }
  if (json_value.is_string()) {
    return py::str(json_value.get<std::string>());
  }
  if (json_value.is_array()) {
    py::list list;
    for (const auto& element : json_value) {
      list.append(json_to_py(element));
    }
    return list;
  }
  if (json_value.is_object()) {
    py::dict dict;
    for (const auto& entry : json_value.items()) {
      dict[py::str(entry.key())] = json_to_py(entry.value());
    }
    return dict;
  }
  throw std::runtime_error("Unhandled JSON type");
}

py::object item_or_none(const std::optional<adapt::Item>& item) {
  if (!item.has_value()) {
    return py::none();
  }
  return json_to_py(adapt::bridge::to_json(*item));
}

class PySessionEngine {
public:
  PySessionEngine(py::object items, py::object config)
      : engine_(adapt::make_engine(adapt::bridge::item_pool_from_json(py_to_json(items)),
                                   adapt::bridge::engine_config_from_json(py_to_json(config)))) {}

  py::object start() {
    return json_to_py(adapt::bridge::to_json(engine_->start()));
  }

  py::object record_response_and_advance(const std::string& item_id, bool correct,
                                         double time_taken) {
    return item_or_none(engine_->record_response_and_advance(item_id, correct, time_taken));
  }

  py::object next_item() {
    return item_or_none(engine_->next_item());
  }

  py::object finish() {
    return json_to_py(adapt::bridge::to_json(engine_->finish()));
  }

  std::string state() const { return adapt::to_string(engine_->state()); }

  double theta() const { return engine_->theta(); }

  double standard_error() const { return engine_->standard_error(); }

  bool has_converged() const { return engine_->has_converged(); }

  std::string ability_band() const { return adapt::display_label(engine_->ability_band()); }

  py::object statistics() const {
    return json_to_py(adapt::bridge::to_json(engine_->statistics()));
  }

  py::object snapshot() const {
    return json_to_py(adapt::bridge::to_json(engine_->snapshot()));
  }

  py::object item_parameters(const std::string& item_id) const {
    auto params = engine_->item_parameters(item_id);
    if (!params.has_value()) {
      return py::none();
    }
    return json_to_py(adapt::bridge::to_json(*params));
  }

  double predict_success(const std::string& item_id) const {
    return engine_->predict_success(item_id);
  }

  std::size_t remaining_items() const { return engine_->remaining_items(); }

  py::object debug_state() const { return json_to_py(engine_->debug_state()); }

private:
  std::unique_ptr<adapt::SessionEngine> engine_;
};

} // namespace

PYBIND11_MODULE(_adaptcore, m) {
  py::class_<PySessionEngine>(m, "SessionEngine")
      .def(py::init<py::object, py::object>(), py::arg("items"), py::arg("config") = py::none())
      .def("start", &PySessionEngine::start)
      .def("record_response_and_advance", &PySessionEngine::record_response_and_advance,
           py::arg("item_id"), py::arg("correct"), py::arg("time_taken"))
      .def("next_item", &PySessionEngine::next_item)
      .def("finish", &PySessionEngine::finish)
      .def("state", &PySessionEngine::state)
      .def("theta", &PySessionEngine::theta)
      .def("standard_error", &PySessionEngine::standard_error)
      .def("has_converged", &PySessionEngine::has_converged)
      .def("ability_band", &PySessionEngine::ability_band)
      .def("statistics", &PySessionEngine::statistics)
      .def("snapshot", &PySessionEngine::snapshot)
      .def("item_parameters", &PySessionEngine::item_parameters)
      .def("predict_success", &PySessionEngine::predict_success)
      .def("remaining_items", &PySessionEngine::remaining_items)
      .def("debug_state", &PySessionEngine::debug_state);

  m.def("item_difficulty",
        [](const std::string& level, const std::string& label) {
          return adapt::calibration::difficulty(adapt::cognitive_level_from_string(level),
                                                adapt::difficulty_label_from_string(label));
        },
        py::arg("cognitive_level"), py::arg("difficulty"));
  m.def("probability_correct", &adapt::model::probability_correct, py::arg("theta"),
        py::arg("b"));
  m.def("information", &adapt::model::information, py::arg("theta"), py::arg("b"));
  m.def("simulate",
        [](py::object items, double true_theta, std::uint64_t seed, std::size_t max_items,
           bool stop_on_convergence) {
          adapt::simulation::SimulationConfig config;
          config.true_theta = true_theta;
          config.seed = seed;
          config.max_items = max_items;
          config.stop_on_convergence = stop_on_convergence;
          auto snapshot = adapt::simulation::run(
              adapt::bridge::item_pool_from_json(py_to_json(items)), config);
          return json_to_py(adapt::bridge::to_json(snapshot));
        },
        py::arg("items"), py::arg("true_theta"), py::arg("seed") = 1,
        py::arg("max_items") = 0, py::arg("stop_on_convergence") = false);
}
