#include "core/WaypointStore.hpp"
#include "core/Errors.hpp"
#include "core/GeoUtils.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <utility>

using json = nlohmann::json;

// --- helper: reject non-finite / out of range coordinates
static void check_waypoint(const Waypoint &w, std::size_t i) {
  if (!GeoUtils::valid_lon_lat(w.coord)) {
    std::ostringstream os;
    os << "waypoint " << i << " (" << w.name << ") has invalid coordinate ["
       << w.coord[0] << ", " << w.coord[1] << "]";
    throw InputError(os.str());
  }
}

WaypointStore::WaypointStore(std::vector<Waypoint> waypoints)
    : points_(std::move(waypoints)) {
  for (std::size_t i = 0; i < points_.size(); ++i)
    check_waypoint(points_[i], i);
}

// --- helper: first present key among aliases, as double
static double number_field(const json &j, const char *key, const char *alias,
                           std::size_t i) {
  const char *found = nullptr;
  if (j.contains(key))
    found = key;
  else if (j.contains(alias))
    found = alias;
  if (!found)
    throw InputError("waypoint " + std::to_string(i) + " is missing '" + key +
                     "'");
  const auto &v = j.at(found);
  if (v.is_number())
    return v.get<double>();
  if (v.is_string()) {
    try {
      return std::stod(v.get<std::string>());
    } catch (const std::exception &) {
      // fall through to the error below
    }
  }
  throw InputError("waypoint " + std::to_string(i) + " has non-numeric '" +
                   found + "'");
}

WaypointStore WaypointStore::from_json(const json &j) {
  const json *arr = &j;
  if (j.is_object() && j.contains("waypoints"))
    arr = &j.at("waypoints");
  if (!arr->is_array())
    throw InputError("waypoints must be a JSON array");

  std::vector<Waypoint> pts;
  pts.reserve(arr->size());
  std::size_t i = 0;
  for (const auto &item : *arr) {
    if (!item.is_object())
      throw InputError("waypoint " + std::to_string(i) + " is not an object");
    Waypoint w;
    w.name = item.value("name", std::string{});
    w.coord = {number_field(item, "longitude", "lon", i),
               number_field(item, "latitude", "lat", i)};
    pts.push_back(std::move(w));
    ++i;
  }
  return WaypointStore(std::move(pts));
}

// --- CSV helpers ---------------------------------------------------------

static std::string trim(const std::string &s) {
  auto b = std::find_if_not(s.begin(), s.end(),
                            [](unsigned char c) { return std::isspace(c); });
  auto e = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c) {
             return std::isspace(c);
           }).base();
  return (b < e) ? std::string(b, e) : std::string{};
}

// split one CSV record; double quotes may wrap fields containing commas
static std::vector<std::string> split_csv_line(const std::string &line) {
  std::vector<std::string> out;
  std::string cur;
  bool quoted = false;
  for (std::size_t i = 0; i < line.size(); ++i) {
    char c = line[i];
    if (quoted) {
      if (c == '"' && i + 1 < line.size() && line[i + 1] == '"') {
        cur.push_back('"');
        ++i;
      } else if (c == '"') {
        quoted = false;
      } else {
        cur.push_back(c);
      }
    } else if (c == '"') {
      quoted = true;
    } else if (c == ',') {
      out.push_back(trim(cur));
      cur.clear();
    } else {
      cur.push_back(c);
    }
  }
  out.push_back(trim(cur));
  return out;
}

static std::string lower(std::string s) {
  for (auto &c : s)
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return s;
}

WaypointStore WaypointStore::from_csv(const std::string &text) {
  std::istringstream in(text);
  std::string line;
  std::vector<std::string> header;
  while (std::getline(in, line)) {
    if (!line.empty() && line.back() == '\r')
      line.pop_back();
    if (trim(line).empty())
      continue;
    header = split_csv_line(line);
    break;
  }
  if (header.empty())
    throw InputError("waypoint CSV is empty");

  int name_col = -1, lon_col = -1, lat_col = -1;
  for (std::size_t c = 0; c < header.size(); ++c) {
    const std::string h = lower(header[c]);
    if (h == "name" || h == "location")
      name_col = static_cast<int>(c);
    else if (h == "longitude" || h == "lon")
      lon_col = static_cast<int>(c);
    else if (h == "latitude" || h == "lat")
      lat_col = static_cast<int>(c);
  }
  if (lon_col < 0 || lat_col < 0)
    throw InputError("waypoint CSV needs 'longitude' and 'latitude' columns");

  std::vector<Waypoint> pts;
  while (std::getline(in, line)) {
    if (!line.empty() && line.back() == '\r')
      line.pop_back();
    if (trim(line).empty())
      continue;
    const auto cols = split_csv_line(line);
    const std::size_t i = pts.size();
    const auto need = static_cast<std::size_t>(std::max(lon_col, lat_col));
    if (cols.size() <= need)
      throw InputError("waypoint " + std::to_string(i) + " has too few columns");

    Waypoint w;
    if (name_col >= 0 && static_cast<std::size_t>(name_col) < cols.size())
      w.name = cols[name_col];
    try {
      w.coord = {std::stod(cols[lon_col]), std::stod(cols[lat_col])};
    } catch (const std::exception &) {
      throw InputError("waypoint " + std::to_string(i) +
                       " has a non-numeric coordinate");
    }
    pts.push_back(std::move(w));
  }
  return WaypointStore(std::move(pts));
}

WaypointStore WaypointStore::load_file(const std::string &path) {
  std::ifstream in(path);
  if (!in)
    throw InputError("cannot open waypoint file " + path);
  std::stringstream buf;
  buf << in.rdbuf();

  const bool is_csv =
      path.size() >= 4 && lower(path.substr(path.size() - 4)) == ".csv";
  if (is_csv)
    return from_csv(buf.str());

  json j;
  try {
    j = json::parse(buf.str());
  } catch (const json::parse_error &e) {
    throw InputError("waypoint file " + path + " is not valid JSON: " +
                     e.what());
  }
  return from_json(j);
}
