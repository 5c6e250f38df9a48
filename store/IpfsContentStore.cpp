#include "IpfsContentStore.h"

#include <httplib.h>
#include <nlohmann/json.hpp>

#include <chrono>

namespace lfs {

namespace {

httplib::Client makeClient(const IpfsContentStore::Config &config) {
  httplib::Client client(config.host, config.port);
  client.set_connection_timeout(std::chrono::milliseconds(config.connectTimeoutMs));
  client.set_read_timeout(std::chrono::milliseconds(config.readTimeoutMs));
  client.set_write_timeout(std::chrono::milliseconds(config.writeTimeoutMs));
  return client;
}

int32_t mapTransportError(httplib::Error err) {
  switch (err) {
  case httplib::Error::ConnectionTimeout:
    return iii::ContentStore::E_TIMEOUT;
  case httplib::Error::Read:
  case httplib::Error::Write:
    return iii::ContentStore::E_IO;
  default:
    return iii::ContentStore::E_UNAVAILABLE;
  }
}

} // namespace

IpfsContentStore::IpfsContentStore() : Module("store.ipfs") {}

IpfsContentStore::IpfsContentStore(const Config &config)
    : Module("store.ipfs"), config_(config) {}

IpfsContentStore::Roe<std::string> IpfsContentStore::put(const std::string &data) {
  auto client = makeClient(config_);
  httplib::UploadFormDataItems items = {
      { "file", data, "chunk", "application/octet-stream" },
  };

  auto res = client.Post("/api/v0/add", items);
  if (!res) {
    return Error(mapTransportError(res.error()),
                 "IPFS add failed: " + httplib::to_string(res.error()));
  }
  if (res->status != 200) {
    return Error(E_PROTOCOL, "IPFS add returned HTTP " + std::to_string(res->status) +
                                 ": " + res->body);
  }

  try {
    auto reply = nlohmann::json::parse(res->body);
    std::string cid = reply.at("Hash").get<std::string>();
    log().debug << "Uploaded chunk " << cid << " (" << data.size() << " bytes)";
    return cid;
  } catch (const nlohmann::json::exception &e) {
    return Error(E_PROTOCOL, std::string("Unexpected IPFS add reply: ") + e.what());
  }
}

IpfsContentStore::Roe<std::string> IpfsContentStore::get(const std::string &address) {
  if (address.empty()) {
    return Error(E_NOT_FOUND, "Empty content address");
  }
  auto client = makeClient(config_);
  auto res = client.Post("/api/v0/cat?arg=" + address);
  if (!res) {
    return Error(mapTransportError(res.error()),
                 "IPFS cat failed: " + httplib::to_string(res.error()));
  }
  if (res->status == 404) {
    return Error(E_NOT_FOUND, "IPFS has no content at " + address);
  }
  if (res->status != 200) {
    return Error(E_PROTOCOL, "IPFS cat returned HTTP " + std::to_string(res->status) +
                                 ": " + res->body);
  }
  log().debug << "Downloaded chunk " << address << " (" << res->body.size() << " bytes)";
  return res->body;
}

bool IpfsContentStore::isAvailable() {
  auto client = makeClient(config_);
  auto res = client.Post("/api/v0/version");
  if (!res) {
    log().debug << "IPFS probe failed: " << httplib::to_string(res.error());
    return false;
  }
  return res->status == 200;
}

} // namespace lfs
