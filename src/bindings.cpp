#include "pigame/config_store.hpp"
#include "pigame/difficulty.hpp"
#include "pigame/digit_source.hpp"
#include "pigame/errors.hpp"
#include "pigame/evaluate.hpp"
#include "pigame/render.hpp"
#include "pigame/session_engine.hpp"
#include "pigame/stats_store.hpp"

#include "json_bridge.hpp"

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <string>
#include <vector>

namespace py = pybind11;

namespace {

// Records, configs and aggregates cross the boundary as JSON text, so the
// Python side sees the same documents the stores write to disk.
nlohmann::json py_to_json(const py::object& value) {
  const auto text = py::module_::import("json").attr("dumps")(value).cast<std::string>();
  return nlohmann::json::parse(text);
}

py::object json_to_py(const nlohmann::json& document) {
  return py::module_::import("json").attr("loads")(document.dump());
}

pigame::PracticeConfig config_from_py(py::object config_obj) {
  if (config_obj.is_none()) {
    return pigame::PracticeConfig{};
  }
  return pigame::bridge::practice_config_from_json(py_to_json(config_obj));
}

std::vector<pigame::SessionRecord> history_from_py(py::object history_obj) {
  return pigame::bridge::history_from_json(py_to_json(history_obj));
}

py::object diff_to_py(const pigame::DiffResult& diff) {
  py::dict out;
  out["matches"] = diff.matches;
  out["mismatch_positions"] = diff.mismatch_positions;
  out["surplus"] = diff.surplus;
  out["error_count"] = diff.error_count;
  out["all_match"] = diff.all_match;
  return out;
}

// Step-driven practice session for hosts that own their own input loop.
class PyPracticeSession {
public:
  PyPracticeSession(py::object config_obj, int start_digits)
      : session_(config_from_py(std::move(config_obj)), start_digits) {}

  void start() { session_.start(pigame::SessionClock::now()); }
  void key(const std::string& text) {
    for (char c : text) {
      session_.handle_key(c, pigame::SessionClock::now());
    }
  }
  void interrupt() { session_.handle_interrupt(pigame::SessionClock::now()); }
  void check_timeout() { session_.handle_timeout(pigame::SessionClock::now()); }

  std::string state() const { return pigame::to_string(session_.state()); }
  int digits_achieved() const { return session_.digits_achieved(); }
  bool ended() const { return session_.ended(); }

  py::object record() const {
    auto json = pigame::bridge::to_json(session_.record());
    json["end"] = pigame::to_string(session_.record().end);
    return json_to_py(json);
  }

private:
  pigame::PracticeSession session_;
};

class PyStatsStore {
public:
  explicit PyStatsStore(const std::string& path) : repo_(path) {}

  py::object load() { return json_to_py(pigame::bridge::to_json(repo_.load())); }
  void append(py::object record_obj) {
    repo_.append(pigame::bridge::session_record_from_json(py_to_json(record_obj)));
  }
  py::object aggregate() {
    return json_to_py(pigame::bridge::to_json(pigame::aggregate(repo_.load())));
  }

private:
  pigame::JsonStatsRepository repo_;
};

} // namespace

PYBIND11_MODULE(pigame_core, m) {
  py::register_exception<pigame::InvalidInput>(m, "InvalidInput", PyExc_ValueError);
  py::register_exception<pigame::InvalidConfig>(m, "InvalidConfig", PyExc_ValueError);
  py::register_exception<pigame::OutOfRange>(m, "OutOfRange", PyExc_IndexError);

  m.def("digits", [](int length) { return std::string(pigame::DigitSource::digits(length)); },
        py::arg("length"));
  m.def("pi_string", &pigame::DigitSource::pi_string, py::arg("length"));
  m.def("max_digits", &pigame::DigitSource::max_digits);
  m.def("evaluate",
        [](const std::string& reference, const std::string& user_input) {
          return diff_to_py(pigame::evaluate(reference, user_input));
        },
        py::arg("reference"), py::arg("user_input"));
  m.def("aggregate",
        [](py::object history) {
          return json_to_py(pigame::bridge::to_json(pigame::aggregate(history_from_py(history))));
        },
        py::arg("history"));
  m.def("render_stats",
        [](py::object history) { return pigame::render_stats(history_from_py(history)); },
        py::arg("history"));
  m.def("compute_start_digits",
        [](py::object history, py::object config) {
          return pigame::compute_start_digits(pigame::aggregate(history_from_py(history)),
                                              config_from_py(config));
        },
        py::arg("history"), py::arg("config") = py::none());
  m.def("default_data_dir", []() { return pigame::default_data_dir().string(); });

  py::class_<PyPracticeSession>(m, "PracticeSession")
      .def(py::init<py::object, int>(), py::arg("config"), py::arg("start_digits"))
      .def("start", &PyPracticeSession::start)
      .def("key", &PyPracticeSession::key, py::arg("text"))
      .def("interrupt", &PyPracticeSession::interrupt)
      .def("check_timeout", &PyPracticeSession::check_timeout)
      .def_property_readonly("state", &PyPracticeSession::state)
      .def_property_readonly("digits_achieved", &PyPracticeSession::digits_achieved)
      .def_property_readonly("ended", &PyPracticeSession::ended)
      .def("record", &PyPracticeSession::record);

  py::class_<PyStatsStore>(m, "StatsStore")
      .def(py::init<std::string>(), py::arg("path"))
      .def("load", &PyStatsStore::load)
      .def("append", &PyStatsStore::append, py::arg("record"))
      .def("aggregate", &PyStatsStore::aggregate);
}
