#include "debug.h"

#include "rtzip.h"
#include "rterror.h"

#include <zlib.h>
#include <cstring>

using namespace std;

namespace rtv
{

#define ZIP_EOCD_SIG 0x06054b50
#define ZIP_CDIR_SIG 0x02014b50
#define ZIP_LOCAL_SIG 0x04034b50
#define ZIP_EOCD_MINLEN 22
#define ZIP_CDIR_MINLEN 46
#define ZIP_LOCAL_MINLEN 30

enum : uint16_t
{
	ZIP_STORED = 0,
	ZIP_DEFLATED = 8
};

static inline uint16_t le16(const uint8_t *p)
{
	return uint16_t(p[0] | (p[1] << 8));
}
static inline uint32_t le32(const uint8_t *p)
{
	return uint32_t(p[0]) | (uint32_t(p[1]) << 8) | (uint32_t(p[2]) << 16) | (uint32_t(p[3]) << 24);
}

static void barf(LPCSTR what)
{
	throw tRetrievalException(mstring("500 Bad ZIP archive: ") + what);
}

tZipReader::tZipReader(const uint8_t *data, size_t len) : m_data(data), m_len(len)
{
}

void tZipReader::Open()
{
	m_entries.clear();
	if(!m_data || m_len < ZIP_EOCD_MINLEN)
		barf("too short");

	// the end record is followed by a comment of up to 64k
	size_t eocd = stmiss;
	size_t lowest = m_len > 0xffff + ZIP_EOCD_MINLEN ? m_len - 0xffff - ZIP_EOCD_MINLEN : 0;
	for(size_t pos = m_len - ZIP_EOCD_MINLEN + 1; pos-- > lowest;)
	{
		if(le32(m_data + pos) == ZIP_EOCD_SIG)
		{
			eocd = pos;
			break;
		}
	}
	if(eocd == stmiss)
		barf("end of central directory not found");

	auto p = m_data + eocd;
	unsigned count = le16(p + 10);
	size_t cdSize = le32(p + 12), cdOffset = le32(p + 16);
	if(cdOffset > m_len || cdSize > m_len - cdOffset)
		barf("bad central directory location");

	auto pos = cdOffset, end = cdOffset + cdSize;
	for(unsigned i = 0; i < count; ++i)
	{
		if(end - pos < ZIP_CDIR_MINLEN || le32(m_data + pos) != ZIP_CDIR_SIG)
			barf("bad central directory entry");
		auto e = m_data + pos;
		tEntry ent;
		ent.method = le16(e + 10);
		ent.crc = le32(e + 16);
		ent.compressedSize = le32(e + 20);
		ent.size = le32(e + 24);
		size_t nameLen = le16(e + 28), extraLen = le16(e + 30), commentLen = le16(e + 32);
		ent.localHeaderOffset = le32(e + 42);
		if(end - pos < ZIP_CDIR_MINLEN + nameLen + extraLen + commentLen)
			barf("truncated central directory");
		ent.name.assign((const char*) e + ZIP_CDIR_MINLEN, nameLen);
		m_entries.emplace_back(move(ent));
		pos += ZIP_CDIR_MINLEN + nameLen + extraLen + commentLen;
	}
}

const tZipReader::tEntry* tZipReader::Find(string_view name) const
{
	for(const auto& e : m_entries)
		if(e.name == name)
			return &e;
	return nullptr;
}

tBytes tZipReader::Extract(const tEntry& ent) const
{
	auto pos = ent.localHeaderOffset;
	if(pos > m_len || m_len - pos < ZIP_LOCAL_MINLEN || le32(m_data + pos) != ZIP_LOCAL_SIG)
		barf("bad local header");
	auto l = m_data + pos;
	size_t dataPos = pos + ZIP_LOCAL_MINLEN + le16(l + 26) + le16(l + 28);
	if(dataPos > m_len || m_len - dataPos < ent.compressedSize)
		barf("truncated member data");
	auto src = m_data + dataPos;

	tBytes ret;
	switch(ent.method)
	{
	case ZIP_STORED:
		if(ent.compressedSize != ent.size)
			barf("inconsistent stored member");
		ret.assign(src, src + ent.size);
		break;
	case ZIP_DEFLATED:
	{
		z_stream zs;
		memset(&zs, 0, sizeof(zs));
		if(Z_OK != inflateInit2(&zs, -MAX_WBITS))
			barf("cannot initialize decompressor");
		tDtorEx cleaner([&zs]() { inflateEnd(&zs); });

		ret.resize(ent.size);
		Bytef dummy;
		zs.next_in = (Bytef*) src;
		zs.avail_in = uInt(ent.compressedSize);
		zs.next_out = ret.empty() ? &dummy : ret.data();
		zs.avail_out = ret.empty() ? 1 : uInt(ret.size());
		auto rc = inflate(&zs, Z_FINISH);
		if(rc != Z_STREAM_END || zs.total_out != ent.size)
			barf("damaged deflated member");
		break;
	}
	default:
		barf("unsupported compression method");
	}
	if(crc32(crc32(0, Z_NULL, 0), ret.data(), uInt(ret.size())) != ent.crc)
		barf("checksum mismatch");
	return ret;
}

}
