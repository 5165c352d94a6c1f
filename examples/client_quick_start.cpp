#include <iostream>
#include "mcplink/client/client.hpp"
#include "mcplink/exceptions.hpp"

// Usage: mcplink_example_client_quick_start [server-command]
// Defaults to the echo example server next to this binary.
int main(int argc, char** argv) {
  using namespace mcplink;
  std::string command = argc > 1 ? argv[1] : "./mcplink_example_echo_server";
  try {
    auto session = client::Client::spawn(command);
    auto init = session->initialize();
    std::cout << "connected to " << init.server_info.name << " " << init.server_info.version
              << std::endl;

    for (const auto& tool : session->list_tools())
      std::cout << "  tool: " << tool.name << " - " << tool.description << std::endl;

    auto result = session->call_tool("echo", Json{{"text", "hello"}});
    std::cout << (result.is_error ? "error: " : "echo: ") << result.text() << std::endl;
    session->close();
  } catch (const RpcError& e) {
    std::cerr << "Server rejected request: " << e.rpc_message() << std::endl;
    return 1;
  } catch (const TransportError& e) {
    std::cerr << "Transport error: " << e.what() << std::endl;
    return 2;
  }
  return 0;
}
