#include <chrono>
#include <condition_variable>
#include <cstdlib>
#include <gtest/gtest.h>
#include <mutex>
#include <thread>
#include <unistd.h>

#include "ctl/ipc.hpp"

TEST(IPC, TestExpandUser)
{
    const char *path      = std::getenv("HOME");
    const char *test_home = "/tmp/ut-home";
    setenv("HOME", test_home, 1);

    EXPECT_EQ(ipc::expand_user("~"), test_home);
    EXPECT_EQ(ipc::expand_user("~/x/y"), std::string(test_home) + "/x/y");
    EXPECT_EQ(ipc::expand_user("/abs/path"), "/abs/path");
    EXPECT_EQ(ipc::expand_user("relative/~/path"), "relative/~/path");

    if (path)
        setenv("HOME", path, 1);
}

TEST(IPC, TestExpandUserNoHomeEnv)
{
    const char *path = std::getenv("HOME");
    unsetenv("HOME");
    EXPECT_EQ(ipc::expand_user("~"), "~");
    EXPECT_EQ(ipc::expand_user("~/x"), "~/x");
    if (path)
        setenv("HOME", path, 1);
}

TEST(IPC, TestStartServerAndRequest)
{
    // temporary socket path
    std::string sock = "/tmp/apdulink-ipc-ut-" + std::to_string(getpid()) + ".sock";

    // run server (blocks until QUIT)
    std::thread th([&] {
        ipc::start_server(sock, [](const std::string &line) {
            return line == "PING" ? std::string("OK PONG") : std::string("OK");
        });
    });
    for (int i = 0; i < 100 && access(sock.c_str(), F_OK) != 0; ++i)
        std::this_thread::sleep_for(std::chrono::milliseconds(10));

    std::string reply;
    ASSERT_TRUE(ipc::request(sock, "PING", reply));
    EXPECT_EQ(reply, "OK PONG");
    ASSERT_TRUE(ipc::request(sock, "QUIT\n", reply));
    EXPECT_EQ(reply, "OK");
    th.join();
    // server should unlink the socket
    EXPECT_FALSE(access(sock.c_str(), F_OK) == 0);
}

TEST(IPC, TestRequestWithoutServer)
{
    std::string reply;
    EXPECT_FALSE(ipc::request("/tmp/apdulink-ipc-none-" + std::to_string(getpid()) + ".sock",
                              "STATUS", reply));
}

TEST(IPC, BlockedRequestDoesNotStallTheNext)
{
    std::string sock = "/tmp/apdulink-ipc-ut2-" + std::to_string(getpid()) + ".sock";

    std::mutex              mu;
    std::condition_variable cv;
    bool                    woken = false;

    // WAIT blocks until a WAKE request has been served
    std::thread th([&] {
        ipc::start_server(sock, [&](const std::string &line) {
            std::unique_lock<std::mutex> lk(mu);
            if (line == "WAKE")
            {
                woken = true;
                cv.notify_all();
                return std::string("OK");
            }
            if (line == "WAIT")
            {
                if (!cv.wait_for(lk, std::chrono::seconds(5), [&] { return woken; }))
                    return std::string("ERR Timeout");
                return std::string("OK woken");
            }
            return std::string("OK");
        });
    });
    for (int i = 0; i < 100 && access(sock.c_str(), F_OK) != 0; ++i)
        std::this_thread::sleep_for(std::chrono::milliseconds(10));

    std::string wait_reply;
    bool        wait_ok = false;
    std::thread waiter([&] { wait_ok = ipc::request(sock, "WAIT", wait_reply); });
    std::this_thread::sleep_for(std::chrono::milliseconds(50));

    std::string reply;
    ASSERT_TRUE(ipc::request(sock, "WAKE", reply));
    EXPECT_EQ(reply, "OK");
    waiter.join();
    EXPECT_TRUE(wait_ok);
    EXPECT_EQ(wait_reply, "OK woken");

    ASSERT_TRUE(ipc::request(sock, "QUIT", reply));
    th.join();
    EXPECT_FALSE(access(sock.c_str(), F_OK) == 0);
}

TEST(IPC, EmptyRequestRefusedLocally)
{
    std::string reply;
    EXPECT_FALSE(ipc::request("/tmp/apdulink-ipc-none.sock", "", reply));
}
