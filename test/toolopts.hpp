// command line options shared by rdtsend and rdtrecv

namespace {

const char *TOOLOPTS_GETOPT = "o:w:m:r:c:k:";

void toolopts_usage()
{
	fprintf(stderr, "  -o name=value -- set a session option (see -o help)\n");
	fprintf(stderr, "  -w count      -- window_capacity\n");
	fprintf(stderr, "  -m bytes      -- max_segment_size\n");
	fprintf(stderr, "  -r count      -- max_retries_per_packet\n");
	fprintf(stderr, "  -c checksum   -- crc32 (default) or sha256[:length]\n");
	fprintf(stderr, "  -k hex        -- key sha256 checksums (HMAC-SHA256)\n");
}

// answer true if ch was one of ours and its argument was usable.
bool toolopts_parse(int ch, const char *arg, rdt::SessionConfig &config, std::string &checksumName, std::string &hexKey)
{
	std::string reason;
	bool ok = true;

	switch(ch)
	{
	case 'o':
		if(0 == strcmp(arg, "help"))
		{
			fprintf(stderr, "options and defaults:\n%s", rdt::SessionConfig().describe().c_str());
			return false;
		}
		ok = config.parseOption(arg, &reason);
		break;
	case 'w':
		ok = config.setOption("window_capacity", arg, &reason);
		break;
	case 'm':
		ok = config.setOption("max_segment_size", arg, &reason);
		break;
	case 'r':
		ok = config.setOption("max_retries_per_packet", arg, &reason);
		break;
	case 'c':
		checksumName = arg;
		break;
	case 'k':
		hexKey = arg;
		break;
	default:
		return false;
	}

	if(not ok)
		fprintf(stderr, "%s\n", reason.c_str());
	return ok;
}

std::shared_ptr<rdt::IChecksumAdapter> toolopts_checksum(const std::string &name, const std::string &hexKey)
{
	if("crc32" == name)
	{
		if(not hexKey.empty())
		{
			fprintf(stderr, "-k needs -c sha256\n");
			return nullptr;
		}
		return std::make_shared<rdt::Crc32ChecksumAdapter>();
	}

	size_t length = 8;
	if(0 == name.compare(0, 7, "sha256:"))
		length = atoi(name.c_str() + 7);
	else if("sha256" != name)
	{
		fprintf(stderr, "unknown checksum %s\n", name.c_str());
		return nullptr;
	}

	if((length < rdt::Sha256ChecksumAdapter_OpenSSL::MIN_DIGEST_LENGTH) or (length > rdt::Sha256ChecksumAdapter_OpenSSL::SHA256_LENGTH))
	{
		fprintf(stderr, "sha256 length must be 4 to 32\n");
		return nullptr;
	}

	auto rv = std::make_shared<rdt::Sha256ChecksumAdapter_OpenSSL>(length);
	if(not hexKey.empty())
	{
		rdt::Bytes key;
		if(not rdt::Hex::decode(hexKey.c_str(), key))
		{
			fprintf(stderr, "can't parse key %s\n", hexKey.c_str());
			return nullptr;
		}
		rv->setKey(key);
	}

	return rv;
}

} // anonymous namespace
