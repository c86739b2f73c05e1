#include <gtest/gtest.h>
#include <errno.h>
#include <fcntl.h>
#include <string.h>
#include <unistd.h>

#include <chrono>
#include <memory>
#include <vector>

#include "netgate.h"
#include "helpers/loopback_listener.h"

using namespace netgate;

namespace {

// lowest free descriptor number
int next_fd()
{
	int fd = open("/dev/null", O_RDONLY);
	if (fd >= 0){
		close(fd);
	}
	return fd;
}

}	// namespace

TEST(Netclient, ConnectsToListener)
{
	LoopbackListener listener;
	ASSERT_TRUE(listener.valid());
	ASSERT_TRUE(listener.listen());

	Netclient client("127.0.0.1", listener.port(), 1000);
	EXPECT_TRUE(client.is_connected());
	EXPECT_TRUE(client.error().empty());
}

TEST(Netclient, ResolvesLocalhost)
{
	LoopbackListener listener;
	ASSERT_TRUE(listener.valid());
	ASSERT_TRUE(listener.listen());

	// localhost may resolve to ::1 first, the IPv4 address must still be tried
	Netclient client("localhost", listener.port(), 1000);
	EXPECT_TRUE(client.is_connected());
}

TEST(Netclient, RefusedWhenNotListening)
{
	LoopbackListener listener;
	ASSERT_TRUE(listener.valid());

	Netclient client("127.0.0.1", listener.port(), 1000);
	EXPECT_FALSE(client.is_connected());
	EXPECT_EQ(client.error(), strerror(ECONNREFUSED));
}

TEST(Netclient, UnknownHost)
{
	Netclient client("no-such-host.invalid", 5432, 1000);
	EXPECT_FALSE(client.is_connected());
	EXPECT_FALSE(client.error().empty());
}

TEST(Netclient, ReleasesSocketOnScopeExit)
{
	LoopbackListener listener;
	ASSERT_TRUE(listener.valid());
	ASSERT_TRUE(listener.listen());

	int before = next_fd();
	ASSERT_GE(before, 0);
	{
		Netclient client("127.0.0.1", listener.port(), 1000);
		ASSERT_TRUE(client.is_connected());
	}
	EXPECT_EQ(next_fd(), before);
}

TEST(Netclient, ReleasesSocketWhenRefused)
{
	LoopbackListener listener;
	ASSERT_TRUE(listener.valid());

	int before = next_fd();
	ASSERT_GE(before, 0);
	{
		Netclient client("127.0.0.1", listener.port(), 1000);
		ASSERT_FALSE(client.is_connected());
	}
	EXPECT_EQ(next_fd(), before);
}

TEST(Netclient, TimesOutAndReleasesSocket)
{
	LoopbackListener listener;
	ASSERT_TRUE(listener.valid());
	ASSERT_TRUE(listener.listen(0));

	// nothing accepts, so once the queue is full further SYNs are dropped
	std::vector<std::unique_ptr<Netclient> > held;
	for (int ii = 0; ii < 8; ++ii){
		std::unique_ptr<Netclient> client(new Netclient("127.0.0.1", listener.port(), 200));
		if (!client->is_connected()){
			break;
		}
		held.push_back(std::move(client));
	}
	ASSERT_LT(held.size(), 8u);

	int before = next_fd();
	ASSERT_GE(before, 0);
	auto t0 = std::chrono::steady_clock::now();
	{
		Netclient client("127.0.0.1", listener.port(), 200);
		EXPECT_FALSE(client.is_connected());
		EXPECT_EQ(client.error(), strerror(ETIMEDOUT));
	}
	auto elapsed = std::chrono::steady_clock::now() - t0;
	EXPECT_EQ(next_fd(), before);
	EXPECT_LT(std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count(), 1000);
}
