#pragma once

#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace reqnav {

/// Generates a fresh node identifier (random 128-bit value, UUID text form).
/// MUST return distinct values across calls within a process.
std::string generate_node_id();

/// Describes a saved HTTP request. The navigator reads name/method only.
class RequestDefinition {
 public:
  RequestDefinition(std::string name, std::string method, std::string url);
  RequestDefinition(std::string id, std::string name, std::string method, std::string url);

  const std::string& id() const { return id_; }
  const std::string& name() const { return name_; }
  const std::string& method() const { return method_; }
  const std::string& url() const { return url_; }

 private:
  std::string id_;
  std::string name_;
  std::string method_;
  std::string url_;
};

/// Describes a saved WebSocket session template.
class SocketDefinition {
 public:
  SocketDefinition(std::string name, std::string endpoint);
  SocketDefinition(std::string id, std::string name, std::string endpoint);

  const std::string& id() const { return id_; }
  const std::string& name() const { return name_; }
  const std::string& endpoint() const { return endpoint_; }

 private:
  std::string id_;
  std::string name_;
  std::string endpoint_;
};

using RequestHandle = std::shared_ptr<RequestDefinition>;
using SocketHandle = std::shared_ptr<SocketDefinition>;

/// Container node shared by collections and folders.
/// Owns its sub-folders; requests and sockets are shared handles so that
/// selection messages can outlive a tree rebuild.
/// MUST keep insertion order for every child list.
class Folder {
 public:
  explicit Folder(std::string name);
  Folder(std::string id, std::string name);
  virtual ~Folder() = default;

  Folder(const Folder&) = delete;
  Folder& operator=(const Folder&) = delete;

  const std::string& id() const { return id_; }
  const std::string& name() const { return name_; }
  void set_name(std::string name) { name_ = std::move(name); }

  const std::vector<std::unique_ptr<Folder>>& folders() const { return folders_; }
  const std::vector<RequestHandle>& requests() const { return requests_; }
  const std::vector<SocketHandle>& sockets() const { return sockets_; }

  /// True when at least one folder, request, or socket hangs below this node.
  bool has_children() const;

  Folder& add_folder(std::string name);
  /// Appends a child; null pointers/handles are ignored and reported as false.
  bool add_folder(std::unique_ptr<Folder> folder);
  bool add_request(RequestHandle request);
  bool add_socket(SocketHandle socket);

  /// Depth-first lookup of a request by id in this node and its sub-folders.
  RequestHandle find_request(const std::string& id) const;
  /// True when `id` names this node or any folder, request, or socket beneath it.
  bool contains_node(const std::string& id) const;

 private:
  std::string id_;
  std::string name_;
  std::vector<std::unique_ptr<Folder>> folders_;
  std::vector<RequestHandle> requests_;
  std::vector<SocketHandle> sockets_;
};

/// Top-level container. Same child model as a folder.
class Collection : public Folder {
 public:
  using Folder::Folder;
};

using CollectionHandle = std::shared_ptr<Collection>;

}  // namespace reqnav
