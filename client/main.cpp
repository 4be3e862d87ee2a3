#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

#include "absl/strings/str_split.h"
#include "gflags/gflags.h"
#include "glog/logging.h"
#include "grpc++/channel.h"
#include "grpc++/client_context.h"
#include "grpc++/create_channel.h"
#include "grpc++/security/credentials.h"
#include "proto/execution.grpc.pb.h"

DEFINE_string(server, "127.0.0.1:7070", "address of the server");  // NOLINT
DEFINE_string(language, "", "language of the source file");        // NOLINT
DEFINE_string(input_file, "",  // NOLINT
              "file with the standard input of the program");
DEFINE_string(args, "",  // NOLINT
              "comma separated arguments of the program");
DEFINE_int32(timeout_ms, 0,  // NOLINT
             "execution timeout, the language default if unset");

namespace {

std::string ReadFile(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) throw std::runtime_error("Cannot open " + path);
  std::stringstream contents;
  contents << in.rdbuf();
  return contents.str();
}

int Fail(const grpc::Status& status) {
  std::cerr << "Error " << status.error_code() << ": "
            << status.error_message() << std::endl;
  return 2;
}

int Execute(proto::CodeRunner::Stub* stub, const std::string& path) {
  proto::ExecuteRequest request;
  request.set_language(FLAGS_language);
  request.set_code(ReadFile(path));
  if (!FLAGS_input_file.empty()) {
    request.set_input(ReadFile(FLAGS_input_file));
  }
  if (!FLAGS_args.empty()) {
    for (absl::string_view arg : absl::StrSplit(FLAGS_args, ',')) {
      request.add_arg(std::string(arg));
    }
  }
  request.set_timeout_ms(FLAGS_timeout_ms);

  grpc::ClientContext context;
  proto::ExecuteResponse response;
  grpc::Status status = stub->Execute(&context, request, &response);
  if (!status.ok()) return Fail(status);
  std::cout << response.output();
  std::cerr << response.error();
  if (!response.error().empty() && response.error().back() != '\n') {
    std::cerr << std::endl;
  }
  std::cerr << "[" << proto::Outcome_Name(response.outcome()) << " in "
            << response.execution_time_ms() << "ms";
  if (response.has_exit_code()) std::cerr << ", exit " << response.exit_code();
  if (response.truncated()) std::cerr << ", output truncated";
  std::cerr << "]" << std::endl;
  return response.success() ? 0 : 1;
}

int ListLanguages(proto::CodeRunner::Stub* stub) {
  grpc::ClientContext context;
  proto::ListLanguagesResponse response;
  grpc::Status status =
      stub->ListLanguages(&context, proto::ListLanguagesRequest(), &response);
  if (!status.ok()) return Fail(status);
  for (const proto::LanguageInfo& info : response.language()) {
    std::cout << info.id() << "\t" << info.display_name() << "\t"
              << info.file_extension() << std::endl;
  }
  return 0;
}

int Health(proto::CodeRunner::Stub* stub) {
  grpc::ClientContext context;
  proto::HealthResponse response;
  grpc::Status status =
      stub->Health(&context, proto::HealthRequest(), &response);
  if (!status.ok()) return Fail(status);
  std::cout << proto::DaemonState_Name(response.state()) << ", "
            << response.consecutive_failures() << " consecutive failures, "
            << "backoff " << response.backoff_ms() << "ms" << std::endl;
  return response.is_available() ? 0 : 1;
}

}  // namespace

int main(int argc, char** argv) {
  gflags::SetUsageMessage(
      "coderunner_client execute --language=<id> <file>\n"
      "coderunner_client languages\n"
      "coderunner_client health");
  gflags::ParseCommandLineFlags(&argc, &argv, true);
  google::InitGoogleLogging(argv[0]);  // NOLINT

  if (argc < 2) {
    gflags::ShowUsageWithFlagsRestrict(argv[0], "client/main");
    return 2;
  }
  auto channel =
      grpc::CreateChannel(FLAGS_server, grpc::InsecureChannelCredentials());
  std::unique_ptr<proto::CodeRunner::Stub> stub =
      proto::CodeRunner::NewStub(channel);

  std::string command = argv[1];
  if (command == "execute") {
    CHECK_EQ(argc, 3) << "execute needs exactly one source file";
    CHECK_NE(FLAGS_language, "") << "You need to specify a language!";
    try {
      return Execute(stub.get(), argv[2]);
    } catch (const std::runtime_error& e) {
      LOG(ERROR) << e.what();
      return 2;
    }
  }
  if (command == "languages") return ListLanguages(stub.get());
  if (command == "health") return Health(stub.get());
  LOG(ERROR) << "Unknown command " << command;
  return 2;
}
