#include "SocketPairHandler.hpp"
#include "TestHeaders.hpp"

using namespace relay;

TEST_CASE("FramesOverSocketPair", "[SocketHandler]") {
  auto handler = make_shared<SocketPairHandler>();
  auto fds = handler->createPair();
  int serverFd = fds.first;
  int clientFd = fds.second;

  SECTION("Round trip") {
    handler->writeFrame(clientFd, "LOGIN");
    handler->writeFrame(clientFd, "");
    handler->writeFrame(clientFd, string(MAX_FRAME_SIZE, 'z'));
    REQUIRE(handler->readFrame(serverFd, true) == "LOGIN");
    REQUIRE(handler->readFrame(serverFd, true) == "");
    REQUIRE(handler->readFrame(serverFd, true) == string(MAX_FRAME_SIZE, 'z'));
  }

  SECTION("Oversized frames are refused on write") {
    REQUIRE_THROWS_AS(
        handler->writeFrame(clientFd, string(MAX_FRAME_SIZE + 1, 'z')),
        std::runtime_error);
  }

  SECTION("Invalid length prefix") {
    int64_t length = -5;
    handler->writeAllOrThrow(clientFd, &length, sizeof(int64_t), true);
    REQUIRE_THROWS_AS(handler->readFrame(serverFd, true), std::runtime_error);
  }

  SECTION("Length prefix over the limit") {
    int64_t length = MAX_FRAME_SIZE + 1;
    handler->writeAllOrThrow(clientFd, &length, sizeof(int64_t), true);
    REQUIRE_THROWS_AS(handler->readFrame(serverFd, true), std::runtime_error);
  }

  SECTION("Peer close ends a read") {
    handler->writeFrame(clientFd, "last words");
    handler->close(clientFd);
    REQUIRE(handler->readFrame(serverFd, false) == "last words");
    REQUIRE_THROWS_AS(handler->readFrame(serverFd, false), std::runtime_error);
    clientFd = -1;
  }

  SECTION("Interrupt unblocks a pending read") {
    std::atomic<bool> threw(false);
    std::thread reader([&handler, &threw, serverFd]() {
      try {
        handler->readFrame(serverFd, false);
      } catch (const std::runtime_error& re) {
        threw = true;
      }
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    handler->interrupt(serverFd);
    reader.join();
    REQUIRE(threw);

    // The descriptor stays tracked until its owner closes it
    auto active = handler->getActiveSockets();
    REQUIRE(std::find(active.begin(), active.end(), serverFd) != active.end());
  }

  SECTION("Writes to a closed descriptor fail") {
    handler->close(serverFd);
    REQUIRE_THROWS_AS(handler->writeFrame(serverFd, "hello"),
                      std::runtime_error);
    serverFd = -1;
  }

  if (serverFd >= 0) {
    handler->close(serverFd);
  }
  if (clientFd >= 0) {
    handler->close(clientFd);
  }
  REQUIRE(handler->getActiveSockets().empty());
}
