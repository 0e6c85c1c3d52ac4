#include "etude/analysis.hpp"
#include "etude/converters.hpp"
#include "etude/exercise_library.hpp"
#include "etude/generator.hpp"
#include "etude/pitch.hpp"
#include "etude/score_ops.hpp"
#include "etude/validation.hpp"

#include "json_bridge.hpp"

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <cstdint>
#include <string>

namespace py = pybind11;

namespace {

// Parameter documents arrive as plain Python data: None, bool, int, float,
// str, dicts keyed by str, and lists or tuples of those.
nlohmann::json py_to_json(py::handle value) {
  if (value.is_none()) {
    return nullptr;
  }
  // bool subclasses int.
  if (py::isinstance<py::bool_>(value)) {
    return value.cast<bool>();
  }
  if (py::isinstance<py::int_>(value)) {
    return value.cast<std::int64_t>();
  }
  if (py::isinstance<py::float_>(value)) {
    return value.cast<double>();
  }
  if (py::isinstance<py::str>(value)) {
    return value.cast<std::string>();
  }
  if (py::isinstance<py::dict>(value)) {
    nlohmann::json object = nlohmann::json::object();
    for (const auto& entry : value.cast<py::dict>()) {
      object[py::cast<std::string>(entry.first)] = py_to_json(entry.second);
    }
    return object;
  }
  if (py::isinstance<py::list>(value) || py::isinstance<py::tuple>(value)) {
    nlohmann::json array = nlohmann::json::array();
    for (const auto& item : value.cast<py::sequence>()) {
      array.push_back(py_to_json(item));
    }
    return array;
  }
  throw py::type_error(std::string("etude: no JSON form for Python type ") +
                       Py_TYPE(value.ptr())->tp_name);
}

py::object json_to_py(const nlohmann::json& value) {
  using Kind = nlohmann::json::value_t;
  switch (value.type()) {
    case Kind::null:
      return py::none();
    case Kind::boolean:
      return py::bool_(value.get<bool>());
    case Kind::number_integer:
      return py::int_(value.get<std::int64_t>());
    case Kind::number_unsigned:
      return py::int_(value.get<std::uint64_t>());
    case Kind::number_float:
      return py::float_(value.get<double>());
    case Kind::string:
      return py::str(value.get_ref<const std::string&>());
    case Kind::array: {
      py::list list;
      for (const auto& element : value) {
        list.append(json_to_py(element));
      }
      return std::move(list);
    }
    case Kind::object: {
      py::dict dict;
      for (const auto& entry : value.items()) {
        dict[py::str(entry.key())] = json_to_py(entry.value());
      }
      return std::move(dict);
    }
    default:
      break;
  }
  throw py::type_error("etude: JSON value has no Python form");
}

nlohmann::json measures_to_json(const std::vector<etude::Measure>& measures) {
  nlohmann::json json_measures = nlohmann::json::array();
  for (const auto& measure : measures) {
    json_measures.push_back(etude::bridge::to_json(measure));
  }
  return json_measures;
}

template <typename T>
py::object converted_to_py(const etude::Converted<T>& converted) {
  nlohmann::json out = nlohmann::json::object();
  out["value"] = etude::bridge::to_json(converted.value);
  out["warnings"] = converted.warnings;
  return json_to_py(out);
}

// In-process library over in-memory storage; events are kept for inspection.
class PyExerciseLibrary {
public:
  explicit PyExerciseLibrary(py::object config_obj)
      : library_(storage_, events_, config_from(config_obj)) {
    library_.initialize();
  }

  py::object generate_exercise(const std::string& user_id, const std::string& type,
                               py::object params_obj) {
    auto params = etude::bridge::exercise_parameters_from_json(py_to_json(params_obj));
    auto exercise =
        library_.generate_exercise(user_id, etude::exercise_type_from_string(type), params);
    return json_to_py(etude::bridge::to_json(exercise));
  }

  py::object load_exercise(const std::string& exercise_id) {
    auto exercise = library_.load_exercise(exercise_id);
    if (!exercise) {
      return py::none();
    }
    return json_to_py(etude::bridge::to_json(*exercise));
  }

  py::object list_user_exercises(const std::string& user_id) {
    nlohmann::json out = nlohmann::json::array();
    for (const auto& exercise : library_.list_user_exercises(user_id)) {
      out.push_back(etude::bridge::to_json(exercise));
    }
    return json_to_py(out);
  }

  bool delete_exercise(const std::string& user_id, const std::string& exercise_id) {
    return library_.delete_exercise(user_id, exercise_id);
  }

  std::string save_score(py::object score_obj) {
    return library_.save_score(etude::bridge::score_from_json(py_to_json(score_obj)));
  }

  py::object get_score(const std::string& score_id) {
    auto score = library_.get_score(score_id);
    if (!score) {
      return py::none();
    }
    return json_to_py(etude::bridge::to_json(*score));
  }

  py::object generate_multi_voice_exercise(py::object params_obj) {
    auto params = etude::bridge::multi_voice_parameters_from_json(py_to_json(params_obj));
    return json_to_py(etude::bridge::to_json(library_.generate_multi_voice_exercise(params)));
  }

  py::object search_scores(py::object criteria_obj) {
    auto criteria = etude::bridge::score_search_criteria_from_json(py_to_json(criteria_obj));
    return json_to_py(etude::bridge::to_json(library_.search_scores(criteria)));
  }

  py::object get_user_repertoire(const std::string& user_id) {
    nlohmann::json out = nlohmann::json::array();
    for (const auto& entry : library_.get_user_repertoire(user_id)) {
      out.push_back(etude::bridge::to_json(entry));
    }
    return json_to_py(out);
  }

  void update_repertoire_status(const std::string& user_id, const std::string& score_id,
                                const std::string& status) {
    library_.update_repertoire_status(user_id, score_id,
                                      etude::repertoire_status_from_string(status));
  }

  void record_practice_session(const std::string& user_id, const std::string& score_id,
                               py::object entry_obj) {
    library_.record_practice_session(
        user_id, score_id, etude::bridge::performance_entry_from_json(py_to_json(entry_obj)));
  }

  std::size_t sweep_expired() { return library_.sweep_expired(); }

  py::object health() { return json_to_py(etude::bridge::to_json(library_.health())); }

  py::object events() const {
    nlohmann::json out = nlohmann::json::array();
    for (const auto& event : events_.events()) {
      out.push_back(etude::bridge::to_json(event));
    }
    return json_to_py(out);
  }

private:
  static etude::LibraryConfig config_from(py::object config_obj) {
    if (config_obj.is_none()) {
      return etude::LibraryConfig{};
    }
    return etude::bridge::library_config_from_json(py_to_json(config_obj));
  }

  etude::InMemoryStorage storage_;
  etude::EventLog events_;
  etude::ExerciseLibrary library_;
};

} // namespace

PYBIND11_MODULE(_etude, m) {
  m.def("generate", [](const std::string& type, py::object params_obj) {
    auto params = etude::bridge::exercise_parameters_from_json(py_to_json(params_obj));
    return json_to_py(measures_to_json(
        etude::generate_exercise_measures(etude::exercise_type_from_string(type), params)));
  });
  m.def("exercise_schema", [] { return json_to_py(etude::exercise_schema().to_json()); });
  m.def("validate_score", [](py::object score_obj) {
    auto score = etude::bridge::score_from_json(py_to_json(score_obj));
    return json_to_py(etude::bridge::to_json(etude::validate_score(score)));
  });
  m.def("flat_to_multi_voice", [](py::object sheet_obj) {
    auto sheet = etude::bridge::sheet_music_from_json(py_to_json(sheet_obj));
    return converted_to_py(
        etude::flat_to_multi_voice_with_report(sheet, std::chrono::system_clock::now()));
  });
  m.def("multi_voice_to_flat", [](py::object score_obj) {
    auto score = etude::bridge::score_from_json(py_to_json(score_obj));
    return converted_to_py(etude::multi_voice_to_flat_with_report(score));
  });
  m.def("extract_voice", [](py::object score_obj, const std::string& voice_id) {
    auto score = etude::bridge::score_from_json(py_to_json(score_obj));
    return json_to_py(etude::bridge::to_json(
        etude::extract_voice(score, voice_id, std::chrono::system_clock::now())));
  });
  m.def("merge_scores", [](py::object scores_obj) {
    const auto json_scores = py_to_json(scores_obj);
    std::vector<etude::Score> scores;
    for (const auto& entry : json_scores) {
      scores.push_back(etude::bridge::score_from_json(entry));
    }
    return json_to_py(etude::bridge::to_json(
        etude::merge_scores(scores, std::nullopt, std::chrono::system_clock::now())));
  });
  m.def("analyze_voice_complexity", [](py::object score_obj, const std::string& voice_id) {
    auto score = etude::bridge::score_from_json(py_to_json(score_obj));
    return json_to_py(etude::bridge::to_json(etude::analyze_voice_complexity(score, voice_id)));
  });
  m.def("note_to_midi", [](const std::string& name) { return etude::note_to_midi(name); });
  m.def("midi_to_note", [](int midi, bool prefer_flats) {
    return etude::midi_to_note(midi, prefer_flats);
  }, py::arg("midi"), py::arg("prefer_flats") = false);

  py::class_<PyExerciseLibrary>(m, "ExerciseLibrary")
      .def(py::init<py::object>(), py::arg("config") = py::none())
      .def("generate_exercise", &PyExerciseLibrary::generate_exercise)
      .def("load_exercise", &PyExerciseLibrary::load_exercise)
      .def("list_user_exercises", &PyExerciseLibrary::list_user_exercises)
      .def("delete_exercise", &PyExerciseLibrary::delete_exercise)
      .def("save_score", &PyExerciseLibrary::save_score)
      .def("get_score", &PyExerciseLibrary::get_score)
      .def("generate_multi_voice_exercise", &PyExerciseLibrary::generate_multi_voice_exercise)
      .def("search_scores", &PyExerciseLibrary::search_scores)
      .def("get_user_repertoire", &PyExerciseLibrary::get_user_repertoire)
      .def("update_repertoire_status", &PyExerciseLibrary::update_repertoire_status)
      .def("record_practice_session", &PyExerciseLibrary::record_practice_session)
      .def("sweep_expired", &PyExerciseLibrary::sweep_expired)
      .def("health", &PyExerciseLibrary::health)
      .def("events", &PyExerciseLibrary::events);
}
