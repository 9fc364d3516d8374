#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <map>
#include <memory>
#include <optional>

#include "tokenrank/errors.hpp"
#include "tokenrank/registry.hpp"

namespace py = pybind11;
using namespace tokenrank;

namespace {

SpecialPolicy policy_from_py(const py::object& allowed_special) {
  if (allowed_special.is_none()) {
    return SpecialPolicy::none();
  }
  if (py::isinstance<py::str>(allowed_special)) {
    std::string v = allowed_special.cast<std::string>();
    if (v == "all") return SpecialPolicy::all();
    if (v == "none") return SpecialPolicy::none();
    return SpecialPolicy::only({v});
  }
  if (py::isinstance<SpecialPolicy>(allowed_special)) {
    return allowed_special.cast<SpecialPolicy>();
  }
  return SpecialPolicy::only(allowed_special.cast<std::unordered_set<std::string>>());
}

py::bytes to_py_bytes(const Bytes& b) { return py::bytes(b.data(), b.size()); }

}  // namespace

PYBIND11_MODULE(pytokenrank, m) {
  auto base_error = py::register_exception<Error>(m, "TokenRankError");
  py::register_exception<ConfigError>(m, "ConfigError", base_error);
  py::register_exception<SpecialTokenViolation>(m, "SpecialTokenViolation", base_error);
  py::register_exception<DecodeError>(m, "DecodeError", base_error);

  py::enum_<DecodeMode>(m, "DecodeMode")
      .value("strict", DecodeMode::strict)
      .value("replace", DecodeMode::replace);

  py::class_<SpecialPolicy>(m, "SpecialPolicy")
      .def_static("all", &SpecialPolicy::all)
      .def_static("none", &SpecialPolicy::none)
      .def_static("only", &SpecialPolicy::only, py::arg("allowed"))
      .def("permits", [](const SpecialPolicy& self, const std::string& literal) { return self.permits(literal); });

  py::class_<CacheStats>(m, "CacheStats")
      .def_readonly("hits", &CacheStats::hits)
      .def_readonly("misses", &CacheStats::misses)
      .def_readonly("entries", &CacheStats::entries);

  py::class_<Encoding, std::shared_ptr<Encoding>>(m, "Encoding")
      .def(py::init([](const std::string& name, const std::string& pattern, const py::dict& ranks,
                       const std::map<std::string, Rank>& special_tokens, std::optional<std::size_t> n_vocab) {
             EncodingSpec spec;
             spec.name = name;
             spec.pattern = pattern;
             for (auto item : ranks) {
               spec.mergeable_ranks.emplace(item.first.cast<std::string>(), item.second.cast<Rank>());
             }
             for (const auto& [k, v] : special_tokens) spec.special_tokens.emplace(k, v);
             spec.explicit_n_vocab = n_vocab;
             return std::make_shared<Encoding>(std::move(spec), Config::from_environment());
           }),
           py::arg("name"), py::arg("pat_str"), py::arg("mergeable_ranks"), py::arg("special_tokens"),
           py::arg("explicit_n_vocab") = py::none())
      .def_property_readonly("name", &Encoding::name)
      .def_property_readonly("max_token_value", &Encoding::max_token_value)
      .def_property_readonly("n_vocab", &Encoding::n_vocab)
      .def_property_readonly("eot_token", &Encoding::eot_token)
      .def_property_readonly("special_tokens_set", &Encoding::special_tokens_set)
      .def("encode_ordinary",
           [](const Encoding& self, const std::string& text) {
             py::gil_scoped_release release;
             return self.encode_ordinary(text);
           },
           py::arg("text"))
      .def("encode",
           [](const Encoding& self, const std::string& text, const py::object& allowed_special) {
             SpecialPolicy policy = policy_from_py(allowed_special);
             py::gil_scoped_release release;
             return self.encode(text, policy);
           },
           py::arg("text"), py::arg("allowed_special") = py::none())
      .def("encode_ordinary_batch", &Encoding::encode_ordinary_batch, py::arg("texts"),
           py::call_guard<py::gil_scoped_release>())
      .def("encode_batch",
           [](const Encoding& self, const std::vector<std::string>& texts, const py::object& allowed_special) {
             SpecialPolicy policy = policy_from_py(allowed_special);
             py::gil_scoped_release release;
             return self.encode_batch(texts, policy);
           },
           py::arg("texts"), py::arg("allowed_special") = py::none())
      .def("encode_with_unstable",
           [](const Encoding& self, const std::string& text, const py::object& allowed_special) {
             auto res = self.encode_with_unstable(text, policy_from_py(allowed_special));
             return py::make_tuple(res.tokens, std::vector<Tokens>(res.completions.begin(), res.completions.end()));
           },
           py::arg("text"), py::arg("allowed_special") = py::none())
      .def("encode_single_token",
           [](const Encoding& self, const py::bytes& b) { return self.encode_single_token(std::string(b)); })
      .def("encode_single_piece",
           [](const Encoding& self, const py::bytes& b) { return self.encode_single_piece(std::string(b)); })
      .def("decode_bytes",
           [](const Encoding& self, const Tokens& tokens) { return to_py_bytes(self.decode_bytes(tokens)); })
      .def("decode", &Encoding::decode, py::arg("tokens"), py::arg("mode") = DecodeMode::strict)
      .def("decode_batch", &Encoding::decode_batch, py::arg("batch"), py::arg("mode") = DecodeMode::strict,
           py::call_guard<py::gil_scoped_release>())
      .def("decode_single_token_bytes",
           [](const Encoding& self, Rank token) { return to_py_bytes(self.decode_single_token_bytes(token)); })
      .def("decode_tokens_bytes",
           [](const Encoding& self, const Tokens& tokens) {
             py::list out;
             for (const auto& b : self.decode_tokens_bytes(tokens)) out.append(to_py_bytes(b));
             return out;
           })
      .def("token_byte_values",
           [](const Encoding& self) {
             py::list out;
             for (const auto& b : self.token_byte_values()) out.append(to_py_bytes(b));
             return out;
           })
      .def("cache_stats", &Encoding::cache_stats)
      .def("clear_cache", &Encoding::clear_cache);

  m.def("list_encoding_names", &list_encoding_names);
  m.def("get_encoding", [](const std::string& name) { return std::const_pointer_cast<Encoding>(get_encoding(name)); },
        py::arg("encoding_name"));
  m.def("encoding_for_model",
        [](const std::string& model) { return std::const_pointer_cast<Encoding>(encoding_for_model(model)); },
        py::arg("model_name"));
  m.def("encoding_name_for_model", &encoding_name_for_model, py::arg("model_name"));
}
