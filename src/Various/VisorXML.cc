/*
 * Copyright (c) 2026 Pavel Vainerman.
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Lesser General Public License as
 * published by the Free Software Foundation, version 2.1.
 *
 * This program is distributed in the hope that it will be useful, but
 * WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU
 * Lesser General Lesser Public License for more details.
 *
 * You should have received a copy of the GNU Lesser General Public License
 * along with this program. If not, see <http://www.gnu.org/licenses/>.
 */
// --------------------------------------------------------------------------
/*! \file
 *  \author Vitaly Lipatov
 */
// --------------------------------------------------------------------------
#include <unistd.h>

#include <string>

#include "VisorTypes.h"
#include "VisorXML.h"
#include "Exceptions.h"
#include <libxml/xinclude.h>
// -----------------------------------------------------------------------------
using namespace devvisor;
using namespace std;
// -----------------------------------------------------------------------------
VisorXML::VisorXML(const string& fname):
	filename(fname)
{
	open(filename);
}

VisorXML::VisorXML()
{
}
// -----------------------------------------------------------------------------
VisorXML::~VisorXML()
{
	close();
}
// -----------------------------------------------------------------------------
string VisorXML::getFileName() const noexcept
{
	return filename;
}
// -----------------------------------------------------------------------------
xmlNode* VisorXML::getFirstNode() const noexcept
{
	if( !doc )
		return nullptr;

	return xmlDocGetRootElement(doc.get());
}
// -----------------------------------------------------------------------------
void VisorXML::open( const string& _filename )
{
	// повторное открытие заменяет предыдущий документ
	close();

	if( _filename.empty() || access(_filename.c_str(), R_OK) != 0 )
		throw NameNotFound("VisorXML(open): NotFound file=" + _filename);

	// Can read files in any encoding, recode to UTF-8 internally
	xmlDoc* d = xmlReadFile(_filename.c_str(), NULL, XML_PARSE_NOBLANKS | XML_PARSE_NONET);

	if( d == NULL )
		throw NameNotFound("VisorXML(open): can't parse file=" + _filename);

	doc.reset(d);

	if( xmlDocGetRootElement(d) == NULL )
	{
		close();
		throw NameNotFound("VisorXML(open): empty document file=" + _filename);
	}

	// Support for XInclude
	// main tag must to have follow property: xmlns:xi="http://www.w3.org/2001/XInclude"
	// For include: <xi:include href="services.xml"/>
	if( xmlXIncludeProcessFlags(doc.get(), XML_PARSE_NOBLANKS | XML_PARSE_NONET) < 0 )
	{
		close();
		throw NameNotFound("VisorXML(open): XInclude processing failed for file=" + _filename);
	}

	filename = _filename;
}
// -----------------------------------------------------------------------------
void VisorXML::close()
{
	doc = nullptr;
	filename = "";
}
// -----------------------------------------------------------------------------
bool VisorXML::isOpen() const noexcept
{
	return (doc != nullptr);
}
// -----------------------------------------------------------------------------
string VisorXML::getProp2(const xmlNode* node, const string& name, const string& defval) noexcept
{
	string s(getProp(node, name));

	if( !s.empty() )
		return s;

	return defval;
}
// -----------------------------------------------------------------------------
string VisorXML::getProp(const xmlNode* node, const string& name) noexcept
{
	if( node == NULL )
		return "";

	xmlChar* text = ::xmlGetProp((xmlNode*)node, (const xmlChar*)name.c_str());

	if( text == NULL )
		return "";

	const string t( (const char*)text );
	xmlFree(text);
	return t;
}
// -----------------------------------------------------------------------------
int VisorXML::getIntProp(const xmlNode* node, const string& name ) noexcept
{
	int v = 0;

	if( !devvisor::str_to_int(getProp(node, name), v) )
		return 0;

	return v;
}
// -----------------------------------------------------------------------------
int VisorXML::getPIntProp(const xmlNode* node, const string& name, int def ) noexcept
{
	int i = getIntProp(node, name);

	if( i <= 0 )
		return def;

	return i;
}
// -----------------------------------------------------------------------------
xmlNode* VisorXML::findNodeLevel1( xmlNode* root, const string& nodename, const string& nm ) const
{
	if( root == NULL )
		return NULL;

	for( xmlNode* node = root->children; node; node = node->next )
	{
		if( node->type != XML_ELEMENT_NODE || nodename != (const char*)node->name )
			continue;

		if( nm.empty() || nm == getProp(node, "name") )
			return node;
	}

	return NULL;
}
// -----------------------------------------------------------------------------
bool VisorXML_iterator::goNext() noexcept
{
	if( !curNode )
		return false;

	curNode = curNode->next;

	if( !curNode )
		return false;

	if( curNode->type != XML_ELEMENT_NODE )
		return goNext();

	return true;
}
// -------------------------------------------------------------------------
bool VisorXML_iterator::goChildren() noexcept
{
	if (!curNode || !curNode->children )
		return false;

	xmlNode* tmp = curNode;
	curNode = curNode->children;

	// текст и комментарии пропускаем
	if( curNode->type != XML_ELEMENT_NODE && !goNext() )
	{
		curNode = tmp;
		return false;
	}

	return true;
}
// -------------------------------------------------------------------------
xmlNode* VisorXML_iterator::getCurrent() noexcept
{
	return curNode;
}
// -------------------------------------------------------------------------
const string VisorXML_iterator::getName() const noexcept
{
	if( curNode )
	{
		if( !curNode->name )
			return "";

		return (const char*) curNode->name;
	}

	return "";
}
// -------------------------------------------------------------------------
string VisorXML_iterator::getProp2( const string& name, const string& defval ) const noexcept
{
	return VisorXML::getProp2(curNode, name, defval);
}

string VisorXML_iterator::getProp( const string& name ) const noexcept
{
	return VisorXML::getProp(curNode, name);
}
// -------------------------------------------------------------------------
int VisorXML_iterator::getIntProp( const string& name ) const noexcept
{
	return VisorXML::getIntProp(curNode, name);
}

int VisorXML_iterator::getPIntProp( const string& name, int def ) const noexcept
{
	return VisorXML::getPIntProp(curNode, name, def);
}
// -------------------------------------------------------------------------
