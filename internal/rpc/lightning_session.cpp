#include "lightning_session.hpp"

#include <google/protobuf/util/json_util.h>

#include "bolt/controller/v1.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "rpc_error.hpp"

namespace bolt::rpc {

using bolt::observability::StringField;

namespace {

std::string ToJson(const google::protobuf::Message& message) {
  google::protobuf::util::JsonPrintOptions options;
  options.preserve_proto_field_names    = true;
  options.always_print_primitive_fields = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(message, &json, options);
  if (!status.ok()) {
    return "{}";
  }
  return json;
}

// Drains one server stream into the sink. Ends on cancel or stream error.
template <typename Item>
void Pump(::grpc::ClientReaderInterface<Item>* reader, const char* event, const PushSink& sink) {
  Item item;
  while (reader->Read(&item)) {
    sink(event, ToJson(item));
  }

  const auto status = reader->Finish();
  if (!status.ok() && status.error_code() != ::grpc::StatusCode::CANCELLED) {
    BOLT_LOG_WARN("Subscription ended", {StringField("event", event), StringField("error", status.error_message())});
  }
}

} // namespace

LightningSession::~LightningSession() {
  StopStreams();
}

void LightningSession::Handshake(const std::shared_ptr<::grpc::Channel>& channel, const ConnectOptions& options) {
  auto stub = lnrpc::Lightning::NewStub(channel);

  ::grpc::ClientContext context;
  PrepareContext(&context, options.connect_timeout);

  lnrpc::GetInfoRequest  request;
  lnrpc::GetInfoResponse response;
  const auto             status = stub->GetInfo(&context, request, &response);
  if (!status.ok()) {
    ThrowConnectError(status);
  }

  BOLT_LOG_INFO("Lightning interface active",
                {StringField("alias", response.alias()), StringField("pubkey", response.identity_pubkey())});
}

void LightningSession::Subscribe(PushSink sink) {
  auto channel = Channel();
  if (!channel) {
    throw util::InvalidState("lightning session is not connected");
  }

  std::lock_guard lock(streams_mutex_);
  if (!streams_.empty()) {
    throw util::InvalidState("lightning session is already subscribed");
  }

  auto stub = std::shared_ptr<lnrpc::Lightning::Stub>(lnrpc::Lightning::NewStub(channel));

  {
    Stream stream;
    stream.context = std::make_unique<::grpc::ClientContext>();
    PrepareContext(stream.context.get(), std::chrono::milliseconds(0));
    auto* context  = stream.context.get();
    stream.worker  = std::thread([stub, context, sink] {
      lnrpc::InvoiceSubscription request;
      auto                       reader = stub->SubscribeInvoices(context, request);
      Pump(reader.get(), "invoiceUpdate", sink);
    });
    streams_.push_back(std::move(stream));
  }

  {
    Stream stream;
    stream.context = std::make_unique<::grpc::ClientContext>();
    PrepareContext(stream.context.get(), std::chrono::milliseconds(0));
    auto* context  = stream.context.get();
    stream.worker  = std::thread([stub, context, sink] {
      lnrpc::GetTransactionsRequest request;
      auto                          reader = stub->SubscribeTransactions(context, request);
      Pump(reader.get(), "newTransaction", sink);
    });
    streams_.push_back(std::move(stream));
  }
}

void LightningSession::OnDisconnect() {
  StopStreams();
}

void LightningSession::StopStreams() {
  std::vector<Stream> streams;
  {
    std::lock_guard lock(streams_mutex_);
    streams.swap(streams_);
  }

  for (auto& stream : streams) {
    stream.context->TryCancel();
  }
  for (auto& stream : streams) {
    if (stream.worker.joinable()) {
      stream.worker.join();
    }
  }
}

} // namespace bolt::rpc
