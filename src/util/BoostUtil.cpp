#include "util/BoostUtil.hpp"

#include "util/Exception.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>
#include <vector>

namespace boost_util {

void pretty_print(std::ostream& os, boost::json::value const& jv, std::string* indent) {
  std::string indent_;
  if (!indent) indent = &indent_;
  switch (jv.kind()) {
    case boost::json::kind::object: {
      auto const& obj = jv.get_object();
      if (obj.empty()) {
        os << "{}";
        break;
      }

      // keys are printed in sorted order so that dumps are diffable
      std::vector<boost::json::object::const_iterator> its;
      its.reserve(obj.size());
      for (auto it = obj.begin(); it != obj.end(); ++it) its.push_back(it);
      std::sort(its.begin(), its.end(), [](auto a, auto b) { return a->key() < b->key(); });

      os << "{\n";
      indent->append(2, ' ');
      for (std::size_t i = 0; i < its.size(); ++i) {
        os << *indent << boost::json::serialize(its[i]->key()) << ": ";
        pretty_print(os, its[i]->value(), indent);
        if (i + 1 != its.size()) os << ",";
        os << "\n";
      }
      indent->resize(indent->size() - 2);
      os << *indent << "}";
      break;
    }

    case boost::json::kind::array: {
      auto const& arr = jv.get_array();
      if (arr.empty()) {
        os << "[]";
        break;
      }

      bool is_simple_array = std::none_of(arr.begin(), arr.end(), [](const auto& x) {
        return x.kind() == boost::json::kind::object || x.kind() == boost::json::kind::array;
      });

      // print without newlines if the array contains only simple elements
      if (is_simple_array) {
        os << "[";
        for (std::size_t i = 0; i < arr.size(); ++i) {
          if (i) os << ", ";
          pretty_print(os, arr[i], indent);
        }
        os << "]";
      } else {
        os << "[\n";
        indent->append(2, ' ');
        for (std::size_t i = 0; i < arr.size(); ++i) {
          os << *indent;
          pretty_print(os, arr[i], indent);
          if (i + 1 != arr.size()) os << ",";
          os << "\n";
        }
        indent->resize(indent->size() - 2);
        os << *indent << "]";
      }
      break;
    }

    case boost::json::kind::double_: {
      if (jv.get_double() == 0) {  // avoid printing -0
        os << "0";
      } else {
        os << boost::json::serialize(jv);
      }
      break;
    }

    default:
      os << boost::json::serialize(jv);
      break;
  }
}

std::string pretty_print(boost::json::value const& jv) {
  std::ostringstream ss;
  pretty_print(ss, jv);
  return ss.str();
}

void write_str_to_file(const std::string& str, const boost::filesystem::path& filename) {
  std::ofstream file(filename.string());
  if (!file.is_open()) {
    throw util::CleanException("Unable to open file for writing: {}", filename.string());
  }
  file << str;
}

boost::json::value read_json_file(const boost::filesystem::path& filename) {
  std::ifstream file(filename.string());
  if (!file.is_open()) {
    throw util::CleanException("Unable to open file: {}", filename.string());
  }

  std::stringstream buffer;
  buffer << file.rdbuf();

  boost::system::error_code ec;
  boost::json::value jv = boost::json::parse(buffer.str(), ec);
  if (ec) {
    throw util::CleanException("Failed to parse JSON in {}: {}", filename.string(), ec.message());
  }
  return jv;
}

}  // namespace boost_util
