#include "vector_store.hpp"
#include "errors.hpp"

std::string distance_name(Distance d) {
  switch (d) {
    case Distance::Cosine: return "Cosine";
    case Distance::Dot: return "Dot";
    case Distance::Euclid: return "Euclid";
  }
  return "Cosine";
}

Distance parse_distance(const std::string& name) {
  if (name == "Cosine") return Distance::Cosine;
  if (name == "Dot") return Distance::Dot;
  if (name == "Euclid") return Distance::Euclid;
  throw IndexError("unknown distance: " + name);
}
