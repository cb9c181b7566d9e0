#include <cerrno>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <unistd.h>

#include "rdt/ChecksumAdapter_OpenSSL.hpp"
#include "rdt/Hex.hpp"
#include "rdt/RunLoops.hpp"
#include "rdt/UdpChannel.hpp"
#include "rdt/rdt.hpp"

#include "toolopts.hpp"

using namespace rdt;

namespace {

int verbose = 0;
bool interrupted = false;

void signal_handler(int param)
{
	interrupted = true;
}

bool writeAll(int fd, const uint8_t *bytes, size_t len)
{
	while(len)
	{
		ssize_t rv = ::write(fd, bytes, len);
		if(rv < 0)
		{
			if(EINTR == errno)
				continue;
			return false;
		}
		bytes += rv;
		len -= rv;
	}
	return true;
}

int usage(const char *prog, const char *msg, int rv)
{
	if(msg)
		fprintf(stderr, "%s\n", msg);
	fprintf(stderr, "usage: %s [options]\n", prog);
	fprintf(stderr, "receives from rdtsend and writes the data to stdout in order.\n");
	fprintf(stderr, "  -p port       -- bind to port (default ephemeral)\n");
	fprintf(stderr, "  -B addr:port  -- bind to addr:port explicitly\n");
	toolopts_usage();
	fprintf(stderr, "  -v            -- increase verbose output\n");
	fprintf(stderr, "  -h            -- show this help\n");
	fprintf(stderr, "exits after idle_limit seconds without new data, or on interrupt.\n");
	return rv;
}

}

int main(int argc, char **argv)
{
	SessionConfig config;
	std::string checksumName = "crc32";
	std::string hexKey;
	std::string opts = std::string("vhp:B:") + TOOLOPTS_GETOPT;
	Address bindAddr;
	bindAddr.setFamily(AF_INET);
	int ch;

	while((ch = getopt(argc, argv, opts.c_str())) != -1)
	{
		switch(ch)
		{
		case 'v':
			verbose++;
			break;
		case 'p':
			bindAddr.setPort(atoi(optarg));
			break;
		case 'B':
			if(not bindAddr.setFromPresentation(optarg))
			{
				fprintf(stderr, "can't parse address %s\n", optarg);
				return 1;
			}
			break;

		case 'h':
			return usage(argv[0], NULL, 0);

		default:
			if(not toolopts_parse(ch, optarg, config, checksumName, hexKey))
				return usage(argv[0], NULL, 1);
			break;
		}
	}

	if(optind != argc)
		return usage(argv[0], "unexpected arguments", 1);

	auto checksum = toolopts_checksum(checksumName, hexKey);
	if(not checksum)
		return 1;

	PreferredRunLoop rl;
	UdpChannel channel(&rl);
	Address boundAddr = channel.bind(bindAddr);
	if(boundAddr.isEmpty())
	{
		fprintf(stderr, "can't bind to %s: %s\n", bindAddr.toPresentation().c_str(), strerror(errno));
		return 1;
	}

	std::string reason;
	auto session = Session::makeSession(&rl, &channel, config, checksum.get(), &reason);
	if(not session)
	{
		fprintf(stderr, "bad configuration: %s\n", reason.c_str());
		return 1;
	}

	fprintf(stderr, "Bound to port %u\n", boundAddr.getPort());
	if(verbose > 1)
		fprintf(stderr, "%s", config.describe().c_str());

	auto receiver = session->getReceiver();
	int rv = 0;

	receiver->onMessage = [&] (const uint8_t *bytes, size_t len, uintmax_t id) {
		if(verbose > 1)
			fprintf(stderr, "%Lf delivered %ju (%zu bytes)\n", rl.getCurrentTime(), id, len);
		if(not writeAll(STDOUT_FILENO, bytes, len))
		{
			fprintf(stderr, "error writing stdout: %s\n", strerror(errno));
			rv = 1;
			session->close();
		}
	};

	receiver->onComplete = [&] {
		if(verbose)
			fprintf(stderr, "%Lf receiver finished\n", rl.getCurrentTime());
		rl.stop();
	};

	session->onPacketDiscarded = [&] (const uint8_t *bytes, size_t len, const Address &src, Session::DiscardReason why) {
		if(verbose)
			fprintf(stderr, "%Lf discarded packet from %s: %s\n", rl.getCurrentTime(), src.toPresentation().c_str(), Session::describe(why));
		if(verbose > 2)
			Hex::print(stderr, "discarded", bytes, len);
	};

	bool announcedPeer = false;
	rl.onEveryCycle = [&] {
		if(interrupted)
		{
			interrupted = false;
			fprintf(stderr, "interrupted. closing.\n");
			session->close();
		}

		if(verbose and session->hasPeer() and not announcedPeer)
		{
			fprintf(stderr, "peer is %s\n", session->getPeerAddress().toPresentation().c_str());
			announcedPeer = true;
		}
	};

	::signal(SIGINT, signal_handler);
	::signal(SIGTERM, signal_handler);

	rl.run();

	if(verbose)
	{
		const Session::Stats &stats = session->getStats();
		fprintf(stderr, "received %zu packets, delivered %zu, duplicates %zu, out of order %zu, bad checksum %zu, malformed %zu, unknown peer %zu, acks sent %zu\n",
			stats.packetsReceived, stats.messagesDelivered, stats.duplicatePackets, stats.outOfOrderPackets,
			stats.badChecksumPackets, stats.malformedPackets, stats.unknownPeerPackets, stats.acksSent);
	}

	session->close();

	return rv;
}
