#include "grpc_session.hpp"

#include <fstream>
#include <future>
#include <optional>
#include <sstream>
#include <vector>

#include <google/protobuf/descriptor.h>
#include <google/protobuf/dynamic_message.h>
#include <google/protobuf/util/json_util.h>
#include <grpcpp/generic/generic_stub.h>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "tls_policy.hpp"

namespace bolt::rpc {

using bolt::observability::StringField;

namespace {

std::optional<std::string> ReadFile(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return std::nullopt;
  }
  std::ostringstream contents;
  contents << in.rdbuf();
  return contents.str();
}

std::string LoadCertificate(const Endpoint& endpoint) {
  if (endpoint.system_roots || endpoint.cert_path.empty()) {
    return {};
  }
  auto pem = ReadFile(endpoint.cert_path);
  if (!pem.has_value() || pem->empty()) {
    throw util::CertificateError("Unable to read TLS certificate: " + endpoint.cert_path.string());
  }
  return *pem;
}

std::string LoadMacaroon(const Endpoint& endpoint) {
  if (!endpoint.macaroon_hex.empty()) {
    return endpoint.macaroon_hex;
  }
  if (endpoint.macaroon_path.empty()) {
    throw util::MacaroonError("No macaroon configured");
  }
  // Connect without credentials; a locked node answers UNIMPLEMENTED.
  if (endpoint.macaroon_may_be_absent && !std::filesystem::exists(endpoint.macaroon_path)) {
    BOLT_LOG_INFO("Macaroon not written yet, connecting without it", {StringField("path", endpoint.macaroon_path.string())});
    return {};
  }
  auto bytes = ReadFile(endpoint.macaroon_path);
  if (!bytes.has_value() || bytes->empty()) {
    throw util::MacaroonError("Unable to read macaroon: " + endpoint.macaroon_path.string());
  }
  return HexEncode(*bytes);
}

InvokeResult Failure(::grpc::StatusCode code, std::string message) {
  InvokeResult result;
  result.ok      = false;
  result.code    = static_cast<int>(code);
  result.message = std::move(message);
  return result;
}

} // namespace

std::string HexEncode(const std::string& bytes) {
  static constexpr char kDigits[] = "0123456789abcdef";
  std::string           hex;
  hex.reserve(bytes.size() * 2);
  for (unsigned char c : bytes) {
    hex.push_back(kDigits[c >> 4]);
    hex.push_back(kDigits[c & 0x0f]);
  }
  return hex;
}

void GrpcSession::Connect(const profile::ConnectionProfile& profile, const ConnectOptions& options) {
  if (CanDisconnect()) {
    throw util::InvalidState(std::string(ToString(Kind())) + " session is already connected");
  }

  ApplyCipherSuitesOnce(options.cipher_suites);

  const auto& endpoint = options.endpoint;
  if (endpoint.host.empty()) {
    throw util::HostUnreachableError("No host configured");
  }

  ::grpc::SslCredentialsOptions ssl;
  ssl.pem_root_certs = LoadCertificate(endpoint);

  // The wallet unlocker interface does not take a macaroon, and a fresh
  // local node has not written one yet.
  std::string macaroon;
  if (Kind() == SessionKind::kLightning) {
    macaroon = LoadMacaroon(endpoint);
  }

  ::grpc::ChannelArguments args;
  args.SetInt(GRPC_ARG_MAX_RECEIVE_MESSAGE_LENGTH, 50 * 1024 * 1024);

  auto channel = ::grpc::CreateCustomChannel(endpoint.host, ::grpc::SslCredentials(ssl), args);

  {
    std::lock_guard lock(mutex_);
    macaroon_hex_ = macaroon;
    call_timeout_ = options.call_timeout;
  }

  try {
    Handshake(channel, options);
  } catch (const util::ConnectError&) {
    std::lock_guard lock(mutex_);
    macaroon_hex_.clear();
    throw;
  }

  {
    std::lock_guard lock(mutex_);
    channel_ = std::move(channel);
  }

  BOLT_LOG_INFO("Connected to node interface",
                {StringField("interface", ServiceName()), StringField("host", endpoint.host),
                 StringField("connection_type", bolt::profile::ToString(profile.Type()))});
}

InvokeResult GrpcSession::Invoke(const std::string& method, const std::string& payload_json) {
  auto channel = Channel();
  if (!channel) {
    return Failure(::grpc::StatusCode::FAILED_PRECONDITION, std::string(ServiceName()) + " session is not connected");
  }

  const auto full_name = std::string(ServiceName()) + "." + method;
  const auto* descriptor = google::protobuf::DescriptorPool::generated_pool()->FindMethodByName(full_name);
  if (descriptor == nullptr) {
    return Failure(::grpc::StatusCode::UNIMPLEMENTED, "unknown method " + full_name);
  }
  if (descriptor->client_streaming() || descriptor->server_streaming()) {
    return Failure(::grpc::StatusCode::UNIMPLEMENTED, "streaming method " + full_name + " cannot be invoked directly");
  }

  auto* factory = google::protobuf::MessageFactory::generated_factory();
  std::unique_ptr<google::protobuf::Message> request(factory->GetPrototype(descriptor->input_type())->New());
  std::unique_ptr<google::protobuf::Message> response(factory->GetPrototype(descriptor->output_type())->New());

  if (!payload_json.empty()) {
    google::protobuf::util::JsonParseOptions parse_options;
    parse_options.ignore_unknown_fields = false;
    auto status = google::protobuf::util::JsonStringToMessage(payload_json, request.get(), parse_options);
    if (!status.ok()) {
      return Failure(::grpc::StatusCode::INVALID_ARGUMENT, "invalid payload for " + method + ": " + std::string(status.message()));
    }
  }

  std::string wire;
  if (!request->SerializeToString(&wire)) {
    return Failure(::grpc::StatusCode::INVALID_ARGUMENT, "failed to encode request for " + method);
  }

  ::grpc::Slice      request_slice(wire);
  ::grpc::ByteBuffer request_buffer(&request_slice, 1);
  ::grpc::ByteBuffer response_buffer;

  std::chrono::milliseconds timeout;
  {
    std::lock_guard lock(mutex_);
    timeout = call_timeout_;
  }

  ::grpc::ClientContext context;
  PrepareContext(&context, timeout);

  const auto path = "/" + std::string(ServiceName()) + "/" + method;

  ::grpc::GenericStub          stub(channel);
  std::promise<::grpc::Status> done;
  auto                         completed = done.get_future();
  stub.UnaryCall(&context, path, ::grpc::StubOptions(), &request_buffer, &response_buffer,
                 [&done](::grpc::Status status) { done.set_value(std::move(status)); });

  const auto status = completed.get();
  if (!status.ok()) {
    return Failure(status.error_code(), status.error_message());
  }

  std::vector<::grpc::Slice> slices;
  if (!response_buffer.Dump(&slices).ok()) {
    return Failure(::grpc::StatusCode::INTERNAL, "failed to read response for " + method);
  }
  std::string response_wire;
  for (const auto& slice : slices) {
    response_wire.append(reinterpret_cast<const char*>(slice.begin()), slice.size());
  }
  if (!response->ParseFromString(response_wire)) {
    return Failure(::grpc::StatusCode::INTERNAL, "failed to decode response for " + method);
  }

  google::protobuf::util::JsonPrintOptions print_options;
  print_options.preserve_proto_field_names    = true;
  print_options.always_print_primitive_fields = true;

  InvokeResult result;
  auto         json_status = google::protobuf::util::MessageToJsonString(*response, &result.json, print_options);
  if (!json_status.ok()) {
    return Failure(::grpc::StatusCode::INTERNAL, std::string(json_status.message()));
  }
  result.ok = true;
  return result;
}

bool GrpcSession::CanDisconnect() const {
  std::lock_guard lock(mutex_);
  return channel_ != nullptr;
}

void GrpcSession::Disconnect() {
  if (!CanDisconnect()) {
    return;
  }

  OnDisconnect();

  {
    std::lock_guard lock(mutex_);
    channel_.reset();
    macaroon_hex_.clear();
  }

  BOLT_LOG_INFO("Disconnected from node interface", {StringField("interface", ServiceName())});
}

void GrpcSession::PrepareContext(::grpc::ClientContext* context, std::chrono::milliseconds timeout) const {
  std::string macaroon;
  {
    std::lock_guard lock(mutex_);
    macaroon = macaroon_hex_;
  }
  if (!macaroon.empty()) {
    context->AddMetadata("macaroon", macaroon);
  }
  if (timeout.count() > 0) {
    context->set_deadline(std::chrono::system_clock::now() + timeout);
  }
}

std::shared_ptr<::grpc::Channel> GrpcSession::Channel() const {
  std::lock_guard lock(mutex_);
  return channel_;
}

} // namespace bolt::rpc
