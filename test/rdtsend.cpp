#include <cerrno>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <sys/stat.h>
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

int usage(const char *prog, const char *msg, int rv)
{
	if(msg)
		fprintf(stderr, "%s\n", msg);
	fprintf(stderr, "usage: %s [options] host port\n", prog);
	fprintf(stderr, "reads stdin and sends it reliably to rdtrecv at host port.\n");
	toolopts_usage();
	fprintf(stderr, "  -v            -- increase verbose output\n");
	fprintf(stderr, "  -h            -- show this help\n");
	return rv;
}

}

int main(int argc, char **argv)
{
	SessionConfig config;
	std::string checksumName = "crc32";
	std::string hexKey;
	std::string opts = std::string("vh") + TOOLOPTS_GETOPT;
	int ch;

	while((ch = getopt(argc, argv, opts.c_str())) != -1)
	{
		switch(ch)
		{
		case 'v':
			verbose++;
			break;

		case 'h':
			return usage(argv[0], NULL, 0);

		default:
			if(not toolopts_parse(ch, optarg, config, checksumName, hexKey))
				return usage(argv[0], NULL, 1);
			break;
		}
	}

	if(argc - optind != 2)
		return usage(argv[0], "specify host and port", 1);

	Address dst;
	if(not dst.resolve(argv[optind], argv[optind + 1]))
	{
		fprintf(stderr, "can't resolve %s %s\n", argv[optind], argv[optind + 1]);
		return 1;
	}

	auto checksum = toolopts_checksum(checksumName, hexKey);
	if(not checksum)
		return 1;

	PreferredRunLoop rl;
	UdpChannel channel(&rl);
	Address boundAddr = channel.bind(0, dst.getFamily());
	if(boundAddr.isEmpty())
	{
		fprintf(stderr, "can't bind: %s\n", strerror(errno));
		return 1;
	}

	std::string reason;
	auto session = Session::makeSession(&rl, &channel, config, checksum.get(), &reason);
	if(not session)
	{
		fprintf(stderr, "bad configuration: %s\n", reason.c_str());
		return 1;
	}
	session->setPeerAddress(dst);

	fprintf(stderr, "Sender starting up using port %u, sending to %s\n", boundAddr.getPort(), dst.toPresentation().c_str());
	if(verbose > 1)
		fprintf(stderr, "%s", config.describe().c_str());

	auto sender = session->getSender();
	bool anyFailed = false;
	bool readingStdin = false;
	bool stdinPollable = true;
	size_t bytesRead = 0;

	sender->onClosed = [&] (bool failed) {
		anyFailed = failed;
		rl.stop();
	};

	sender->onRetransmit = [&] (uintmax_t id, size_t count, Duration timeout) {
		if(verbose)
			fprintf(stderr, "%Lf retransmit %ju (%zu) next timeout %Lf\n", rl.getCurrentTime(), id, count, timeout);
	};

	sender->onExhausted = [&] (uintmax_t id) {
		fprintf(stderr, "%Lf gave up on %ju\n", rl.getCurrentTime(), id);
	};

	session->onPacketDiscarded = [&] (const uint8_t *bytes, size_t len, const Address &src, Session::DiscardReason why) {
		if(verbose)
			fprintf(stderr, "%Lf discarded packet from %s: %s\n", rl.getCurrentTime(), src.toPresentation().c_str(), Session::describe(why));
		if(verbose > 2)
			Hex::print(stderr, "discarded", bytes, len);
	};

	Task readStdin;

	// regular files are always readable and can't be polled, so they are read
	// from onWritable for as long as the sender has room.
	struct stat st;
	if((0 == fstat(STDIN_FILENO, &st)) and S_ISREG(st.st_mode))
		stdinPollable = false;

	auto pauseStdin = [&] {
		if(readingStdin and stdinPollable)
			rl.unregisterDescriptor(STDIN_FILENO, RunLoop::READABLE);
		readingStdin = false;
	};

	auto resumeStdin = [&] {
		if(readingStdin)
			return;
		readingStdin = true;

		if(stdinPollable and rl.registerDescriptor(STDIN_FILENO, RunLoop::READABLE, readStdin))
			return;

		if(stdinPollable and verbose)
			fprintf(stderr, "can't poll stdin, reading it when writable\n");
		stdinPollable = false;
		sender->notifyWhenWritable();
	};

	readStdin = [&] {
		std::vector<uint8_t> buf(config.maxSegmentSize);
		ssize_t rv = ::read(STDIN_FILENO, buf.data(), buf.size());

		if(rv < 0)
		{
			if((EINTR == errno) or (EAGAIN == errno))
				return;
			fprintf(stderr, "error reading stdin: %s\n", strerror(errno));
			pauseStdin();
			session->close();
			return;
		}

		if(0 == rv)
		{
			if(verbose)
				fprintf(stderr, "%Lf end of input after %zu bytes\n", rl.getCurrentTime(), bytesRead);
			pauseStdin();
			sender->finish();
			return;
		}

		bytesRead += rv;
		auto receipt = sender->submit(buf.data(), rv);
		if(not receipt)
		{
			fprintf(stderr, "can't send\n");
			pauseStdin();
			session->close();
			return;
		}

		if(verbose > 1)
		{
			uintmax_t firstId = receipt->getFirstId();
			receipt->onFinished = [&rl, firstId] (bool failed) {
				fprintf(stderr, "%Lf %ju %s\n", rl.getCurrentTime(), firstId, failed ? "failed" : "delivered");
			};
		}

		if(stdinPollable and not sender->isWritable())
		{
			pauseStdin();
			sender->notifyWhenWritable();
		}
	};

	sender->onWritable = [&] {
		if(stdinPollable)
		{
			resumeStdin();
			if(stdinPollable)
				return false;
		}

		if(readingStdin)
			readStdin();
		return readingStdin;
	};

	resumeStdin();

	::signal(SIGINT, signal_handler);
	::signal(SIGTERM, signal_handler);

	rl.onEveryCycle = [&] {
		if(interrupted)
		{
			interrupted = false;
			fprintf(stderr, "interrupted. closing.\n");
			pauseStdin();
			session->close();
		}
	};

	rl.run();

	if(verbose)
	{
		const Session::Stats &stats = session->getStats();
		fprintf(stderr, "sent %zu packets (%zu data, %zu retransmitted), received %zu, srtt %Lf rto %Lf\n",
			stats.packetsSent, stats.dataPacketsSent, stats.retransmissions, stats.packetsReceived,
			sender->getRTOEstimator().getSRTT(), sender->getRTOEstimator().currentTimeout());
	}

	session->close();

	return anyFailed ? 1 : 0;
}
