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
 *  \author Vitaly Lipatov, PavelVainerman
 */
// --------------------------------------------------------------------------

// Класс для чтения конфигурации devvisor из XML

#ifndef VisorXML_H_
#define VisorXML_H_

#include <string>
#include <cstddef>
#include <memory>

#include <libxml/parser.h>
#include <libxml/tree.h>
// --------------------------------------------------------------------------
namespace devvisor
{
	class VisorXML_iterator
	{
		public:
			VisorXML_iterator(xmlNode* node) noexcept:
				curNode(node)
			{}
			VisorXML_iterator() noexcept: curNode(0) {}

			std::string getProp2( const std::string& name, const std::string& defval = "" ) const noexcept;
			std::string getProp( const std::string& name ) const noexcept;
			int getIntProp( const std::string& name ) const noexcept;
			/// if value if not positive ( <= 0 ), returns def
			int getPIntProp( const std::string& name, int def ) const noexcept;

			/*! Перейти к следующему узлу. Возвращает false, если некуда перейти */
			bool goNext() noexcept;

			/*! Перейти на один уровень ниже
			    \note Если перейти не удалось, итератор остаётся указывать на прежний узел
			*/
			bool goChildren() noexcept;

			// Получить текущий узел
			xmlNode* getCurrent() noexcept;

			// Получить название текущего узла
			const std::string getName() const noexcept;

		private:

			xmlNode* curNode;
	};
	// --------------------------------------------------------------------------
	class VisorXML
	{
		public:

			typedef VisorXML_iterator iterator;

			VisorXML( const std::string& filename );
			VisorXML();
			~VisorXML();

			xmlNode* getFirstNode() const noexcept;

			/*! Загружает указанный файл
			    \throw NameNotFound если файла нет или его не удалось разобрать
			*/
			void open( const std::string& filename );
			bool isOpen() const noexcept;

			void close();

			std::string getFileName() const noexcept;

			// Получить свойство name указанного узла node
			static std::string getProp(const xmlNode* node, const std::string& name) noexcept;
			static std::string getProp2(const xmlNode* node, const std::string& name, const std::string& defval = "" ) noexcept;

			static int getIntProp(const xmlNode* node, const std::string& name) noexcept;

			/// if value if not positive ( <= 0 ), returns def
			static int getPIntProp(const xmlNode* node, const std::string& name, int def) noexcept;

			/*! Поиск только среди дочерних узлов root (без рекурсии) */
			xmlNode* findNodeLevel1( xmlNode* root, const std::string& nodename, const std::string& nm = "" ) const;

		protected:
			std::string filename;

			struct VisorXMLDocDeleter
			{
				void operator()(xmlDoc* doc) const noexcept
				{
					if( doc )
						xmlFreeDoc(doc);
				}
			};

			std::unique_ptr<xmlDoc, VisorXMLDocDeleter> doc;
	};
	// -------------------------------------------------------------------------
} // end of devvisor namespace
// --------------------------------------------------------------------------
#endif
