#include "rkv/Event.hpp"

#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

namespace rkv {

const char* toString(EventKind k) noexcept {
  switch (k) {
    case EventKind::Updated: return "updated";
    case EventKind::Deleted: return "deleted";
  }
  return "updated";
}

std::string Event::toJson() const {
  rapidjson::StringBuffer buf;
  rapidjson::Writer<rapidjson::StringBuffer> w(buf);
  w.StartObject();
  w.Key("event");
  w.String(toString(kind));
  w.Key("bucket");
  w.String(bucket.c_str(), static_cast<rapidjson::SizeType>(bucket.size()));
  w.Key("key");
  w.String(key.c_str(), static_cast<rapidjson::SizeType>(key.size()));
  w.EndObject();
  return std::string(buf.GetString(), buf.GetSize());
}

} // namespace rkv
