#include "reqnav/collection.h"

#include <cstdint>
#include <random>

namespace reqnav {

namespace {

std::mt19937_64& id_engine() {
  static thread_local std::mt19937_64 engine{std::random_device{}()};
  return engine;
}

}  // namespace

std::string generate_node_id() {
  std::uniform_int_distribution<int> dist(0, 255);
  const char* hex = "0123456789abcdef";
  std::string out;
  out.reserve(36);
  for (int i = 0; i < 16; ++i) {
    uint8_t value = static_cast<uint8_t>(dist(id_engine()));
    if (i == 6) value = static_cast<uint8_t>((value & 0x0fU) | 0x40U);
    if (i == 8) value = static_cast<uint8_t>((value & 0x3fU) | 0x80U);
    if (i == 4 || i == 6 || i == 8 || i == 10) out.push_back('-');
    out.push_back(hex[(value >> 4U) & 0x0fU]);
    out.push_back(hex[value & 0x0fU]);
  }
  return out;
}

RequestDefinition::RequestDefinition(std::string name, std::string method, std::string url)
    : RequestDefinition(generate_node_id(), std::move(name), std::move(method), std::move(url)) {}

RequestDefinition::RequestDefinition(std::string id,
                                     std::string name,
                                     std::string method,
                                     std::string url)
    : id_(std::move(id)),
      name_(std::move(name)),
      method_(std::move(method)),
      url_(std::move(url)) {}

SocketDefinition::SocketDefinition(std::string name, std::string endpoint)
    : SocketDefinition(generate_node_id(), std::move(name), std::move(endpoint)) {}

SocketDefinition::SocketDefinition(std::string id, std::string name, std::string endpoint)
    : id_(std::move(id)), name_(std::move(name)), endpoint_(std::move(endpoint)) {}

Folder::Folder(std::string name) : Folder(generate_node_id(), std::move(name)) {}

Folder::Folder(std::string id, std::string name) : id_(std::move(id)), name_(std::move(name)) {}

bool Folder::has_children() const {
  return !folders_.empty() || !requests_.empty() || !sockets_.empty();
}

Folder& Folder::add_folder(std::string name) {
  folders_.push_back(std::make_unique<Folder>(std::move(name)));
  return *folders_.back();
}

bool Folder::add_folder(std::unique_ptr<Folder> folder) {
  if (!folder) return false;
  folders_.push_back(std::move(folder));
  return true;
}

bool Folder::add_request(RequestHandle request) {
  if (!request) return false;
  requests_.push_back(std::move(request));
  return true;
}

bool Folder::add_socket(SocketHandle socket) {
  if (!socket) return false;
  sockets_.push_back(std::move(socket));
  return true;
}

RequestHandle Folder::find_request(const std::string& id) const {
  for (const auto& request : requests_) {
    if (request->id() == id) return request;
  }
  for (const auto& folder : folders_) {
    if (RequestHandle found = folder->find_request(id)) return found;
  }
  return nullptr;
}

bool Folder::contains_node(const std::string& id) const {
  if (id_ == id) return true;
  for (const auto& request : requests_) {
    if (request->id() == id) return true;
  }
  for (const auto& socket : sockets_) {
    if (socket->id() == id) return true;
  }
  for (const auto& folder : folders_) {
    if (folder->contains_node(id)) return true;
  }
  return false;
}

}  // namespace reqnav
